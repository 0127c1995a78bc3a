#include "fleet/core/Output.hh"
#include "fleet/core/Log.hh"

#include <algorithm>

namespace fleet {

StreamOutput::StreamOutput(std::ostream& stream) : stream_(stream) {}

void StreamOutput::write(std::string_view line) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << line << '\n';
}

void LogOutput::write(std::string_view line) {
    FLEET_LOG_INFO("{}", line);
}

void BufferOutput::write(std::string_view line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.emplace_back(line);
}

std::vector<std::string> BufferOutput::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

bool BufferOutput::contains(std::string_view fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
                       [fragment](const std::string& line) { return line.find(fragment) != std::string::npos; });
}

void BufferOutput::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

} // namespace fleet
