#ifndef LOG_HPP
#define LOG_HPP

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

enum class Log_level {debug, info, warning, error};

std::string_view to_string(Log_level level);

class Log_sink
{
public:
    virtual ~Log_sink() = default;
    virtual void write(Log_level level, std::string_view msg) = 0;
};

// writes "[LEVEL]: msg" lines, dropping anything below threshold
class Stream_log_sink final: public Log_sink
{
public:
    explicit Stream_log_sink(std::ostream & out, Log_level threshold = Log_level::warning);
    void write(Log_level level, std::string_view msg) override;

private:
    std::ostream & out_;
    Log_level threshold_;
};

// Handle passed by value into the decoders. A default constructed Logger has
// no sink and discards everything
class Logger
{
public:
    Logger() = default;
    explicit Logger(std::shared_ptr<Log_sink> sink): sink_{std::move(sink)} {}

    void log(Log_level level, std::string_view msg) const;

    void debug(std::string_view msg) const   { log(Log_level::debug, msg); }
    void info(std::string_view msg) const    { log(Log_level::info, msg); }
    void warning(std::string_view msg) const { log(Log_level::warning, msg); }
    void error(std::string_view msg) const   { log(Log_level::error, msg); }

private:
    std::shared_ptr<Log_sink> sink_;
};

#endif // LOG_HPP
