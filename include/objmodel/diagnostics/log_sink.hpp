#pragma once

#include <objmodel/diagnostics/sink.hpp>

namespace objmodel {

/// Forwards diagnostics to the default logger as warnings
class LogSink : public DiagnosticSink
{
public:
    void report(const Diagnostic& diagnostic) override;

    ~LogSink() override = default;

    /// Process-wide instance used when no other sink has been injected
    static LogSink& get() noexcept;
};

} // namespace objmodel
