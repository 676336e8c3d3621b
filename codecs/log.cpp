#include "log.hpp"

std::string_view to_string(Log_level level)
{
    switch(level)
    {
    case Log_level::debug:
        return "DEBUG";
    case Log_level::info:
        return "INFO";
    case Log_level::warning:
        return "WARNING";
    case Log_level::error:
        return "ERROR";
    }
    return "UNKNOWN";
}

Stream_log_sink::Stream_log_sink(std::ostream & out, Log_level threshold):
    out_{out},
    threshold_{threshold}
{}

void Stream_log_sink::write(Log_level level, std::string_view msg)
{
    if(level < threshold_)
        return;

    out_<<'['<<to_string(level)<<"]: "<<msg<<'\n';
}

void Logger::log(Log_level level, std::string_view msg) const
{
    if(sink_)
        sink_->write(level, msg);
}
