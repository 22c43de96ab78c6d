#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>

namespace ferry::log {

    enum class Level {
        Debug,
        Info,
        Warn,
        Error
    };

    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }

    inline void set_level(Level level) { threshold() = level; }

    inline bool enabled(Level level) { return level >= threshold().load(); }

    /**
     * @brief One log record. Collects the message and writes "[Tag] message" to stderr
     * when it goes out of scope, if its level passes the threshold.
     */
    class Line {
    public:
        Line(Level level, const char* tag) : m_enabled(enabled(level)), m_tag(tag) {}

        Line(const Line&) = delete;
        Line& operator=(const Line&) = delete;

        ~Line() {
            if (m_enabled) {
                std::cerr << "[" << m_tag << "] " << m_stream.str() << "\n";
            }
        }

        template <typename T>
        Line& operator<<(const T& value) {
            if (m_enabled) m_stream << value;
            return *this;
        }

    private:
        bool m_enabled;
        const char* m_tag;
        std::ostringstream m_stream;
    };

    inline Line debug(const char* tag) { return Line(Level::Debug, tag); }
    inline Line info(const char* tag) { return Line(Level::Info, tag); }
    inline Line warn(const char* tag) { return Line(Level::Warn, tag); }
    inline Line error(const char* tag) { return Line(Level::Error, tag); }

}
