#pragma once

#include <functional>
#include <string>

namespace FileToolkit
{
    /**
     * @brief Diagnostic sink for the toolkit.
     *
     * Operations that report failure through a boolean or sentinel value
     * write the reason here. By default messages go to std::cerr; install a
     * Logger to redirect or silence them.
     */
    class Log
    {
    public:
        using Logger = std::function<void(const std::string&)>;

        /**
         * @brief Replaces the active sink. An empty logger restores std::cerr.
         */
        static void setLogger(Logger logger);

        static void info(const std::string& msg);
        static void warning(const std::string& msg);
        static void error(const std::string& msg);

    private:
        static void write(const std::string& line);
        static Logger& logger();
    };

} // namespace FileToolkit
