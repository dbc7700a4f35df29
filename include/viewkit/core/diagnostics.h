#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace viewkit::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t frame = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects structured events from the render pipeline and the scroll view
// layer. Events below the minimum severity are dropped before observers run.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void debug(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Debug, module, stage, message);
    }
    void info(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Info, module, stage, message);
    }
    void warning(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Warning, module, stage, message);
    }

    // Frame counter stamped on every event; advanced by the pipeline owner.
    void set_frame(std::uint64_t frame) { frame_ = frame; }
    std::uint64_t frame() const { return frame_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    // Keep at most this many events; the oldest are discarded first.
    void set_capacity(std::size_t capacity);
    std::size_t capacity() const { return capacity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& module,
                                                 const std::string& stage) const;

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    void trim();

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t frame_ = 0;
    Severity min_severity_ = Severity::Info;
    std::size_t capacity_ = 4096;
};

}  // namespace viewkit::core
