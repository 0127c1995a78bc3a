#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fleet {

// Receives human-readable progress lines for the caller of an event run.
// Lines are never interpreted by the dispatcher.
class OutputSink {
  public:
    virtual ~OutputSink() = default;
    virtual void write(std::string_view line) = 0;
};

// Writes each line followed by a newline to a caller-owned stream.
class StreamOutput : public OutputSink {
  public:
    explicit StreamOutput(std::ostream& stream);
    void write(std::string_view line) override;

  private:
    std::mutex mutex_;
    std::ostream& stream_;
};

// Forwards lines to the root logger at Info level.
class LogOutput : public OutputSink {
  public:
    void write(std::string_view line) override;
};

// Keeps lines in memory for later inspection.
class BufferOutput : public OutputSink {
  public:
    void write(std::string_view line) override;

    std::vector<std::string> lines() const;
    bool contains(std::string_view fragment) const;
    void clear();

  private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

} // namespace fleet
