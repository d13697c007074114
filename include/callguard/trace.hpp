#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace callguard {

// ============================================================================
// TraceSink Interface
//
// Destination for operator diagnostics (debug-mode eviction and rejection
// traces). One line per call to write().
//
// Thread safety: implementations must accept concurrent writes.
// ============================================================================

class TraceSink {
public:
    virtual ~TraceSink() = default;

    // Write one diagnostic line (no trailing newline).
    //
    // Contract:
    // - Should not block for long (called on the request path)
    // - Should not throw
    virtual void write(std::string_view line) noexcept = 0;

    // Flush any buffered data (optional operation).
    virtual void flush() noexcept {}
};

// ============================================================================
// StderrTraceSink: one prefixed line per trace on stderr (default)
// ============================================================================

class StderrTraceSink final : public TraceSink {
public:
    void write(std::string_view line) noexcept override {
        // stdio locks the stream per call, so lines do not interleave
        std::fprintf(stderr, "[callguard] %.*s\n",
                     static_cast<int>(line.size()), line.data());
    }

    void flush() noexcept override {
        std::fflush(stderr);
    }
};

// ============================================================================
// NullTraceSink: discards everything
// ============================================================================

class NullTraceSink final : public TraceSink {
public:
    void write(std::string_view /*line*/) noexcept override {}
};

// ============================================================================
// CapturingTraceSink: keeps lines in memory (for tests)
// ============================================================================

class CapturingTraceSink final : public TraceSink {
public:
    void write(std::string_view line) noexcept override {
        std::lock_guard lock(mutex_);
        try {
            lines_.emplace_back(line);
        } catch (const std::bad_alloc&) {
            ++dropped_;
        }
    }

    [[nodiscard]] std::vector<std::string> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    [[nodiscard]] std::size_t count() const {
        std::lock_guard lock(mutex_);
        return lines_.size();
    }

    // Number of lines containing needle
    [[nodiscard]] std::size_t count_containing(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& l : lines_) {
            if (l.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] std::uint64_t dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::uint64_t dropped_ = 0;
};

// Shared default sink used when none is supplied
inline TraceSink& default_trace_sink() {
    static StderrTraceSink sink;
    return sink;
}

}  // namespace callguard
