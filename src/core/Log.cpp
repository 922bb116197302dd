#include "Log.h"
#include <iostream>
#include <utility>

namespace FileToolkit
{
    Log::Logger& Log::logger()
    {
        static Logger instance;
        return instance;
    }

    void Log::setLogger(Logger logger)
    {
        Log::logger() = std::move(logger);
    }

    void Log::write(const std::string& line)
    {
        const Logger& sink = logger();
        if (sink) sink(line);
        else std::cerr << line << std::endl;
    }

    void Log::info(const std::string& msg)    { write(msg); }
    void Log::warning(const std::string& msg) { write("WARNING: " + msg); }
    void Log::error(const std::string& msg)   { write("ERROR: " + msg); }

} // namespace FileToolkit
