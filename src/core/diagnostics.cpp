#include <surl/core/diagnostics.h>

#include <sstream>
#include <utility>

namespace surl::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug: return "debug";
        case Severity::Error: return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "] " << event.stage;
    if (event.code) {
        oss << " " << errc_name(*event.code) << " at " << event.offset;
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver make_stream_observer(std::ostream& out) {
    return [&out](const DiagnosticEvent& event) {
        out << format_diagnostic(event) << "\n";
    };
}

void DiagnosticEmitter::report_failure(std::string_view stage, std::string_view input,
                                       std::size_t offset, const Error& error) {
    DiagnosticEvent event;
    event.severity = Severity::Error;
    event.stage = std::string(stage);
    event.input = std::string(input);
    event.code = error.code;
    event.offset = offset;
    event.message = error.message();
    emit(std::move(event));
}

void DiagnosticEmitter::report_parsed(std::string_view input, std::string canonical) {
    DiagnosticEvent event;
    event.severity = Severity::Debug;
    event.stage = "done";
    event.input = std::string(input);
    event.message = std::move(canonical);
    emit(std::move(event));
}

void DiagnosticEmitter::emit(DiagnosticEvent event) {
    if (event.severity < min_severity_) {
        return;
    }
    event.timestamp = std::chrono::steady_clock::now();

    events_.push_back(std::move(event));
    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

} // namespace surl::core
