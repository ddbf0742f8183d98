#pragma once

#include <surl/core/error.h>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace surl::core {

enum class Severity {
    Debug,
    Error,
};

const char* severity_name(Severity severity);

// One report about one parse. Failures carry the error code and the byte
// offset in `input` where the failing component starts.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Debug;
    std::string stage;
    std::string input;
    std::optional<Errc> code;
    std::size_t offset = 0;
    std::string message;
};

// "[error] port InvalidPort at 19: invalid port: '70000' is out of range"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Writes one formatted line per event. The stream must outlive the observer.
DiagnosticObserver make_stream_observer(std::ostream& out);

// Collects parse reports and forwards them to observers. Not thread-safe.
class DiagnosticEmitter {
public:
    void report_failure(std::string_view stage, std::string_view input,
                        std::size_t offset, const Error& error);
    void report_parsed(std::string_view input, std::string canonical);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::size_t size() const;

private:
    void emit(DiagnosticEvent event);

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Debug;
};

} // namespace surl::core
