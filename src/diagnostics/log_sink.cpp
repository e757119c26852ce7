#include "diagnostics/log_sink.hpp"

#include "diagnostics/sink.hpp"
#include "logging.hpp"

namespace objmodel {

void LogSink::report(const Diagnostic& diagnostic) {
    LOG_WARN("{}", diagnostic.message);
}

LogSink& LogSink::get() noexcept {
    // thread-safe singleton initialization pattern
    static LogSink local_instance{};

    return local_instance;
}

} // namespace objmodel
