// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_UTILITIES_LOGGING_H
#define NMTSPEC_SRC_UTILITIES_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nmtspec {

namespace specs {
struct ModelSpec;
}

/**
 * @brief Structured log of one conversion run.
 *
 * Every event is appended as one JSON object to a JSON array in the log file
 * (if a file name was given), and a readable form is printed to stdout
 * depending on the verbosity.
 */
class ConversionLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    using OptionValue = std::variant<bool, std::int64_t, float, std::string>;

    ConversionLogger(const std::string& file_name, EVerbosity verbosity);
    ~ConversionLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options);
    void log_checkpoint(const std::string& path, int generation, std::size_t num_variables);
    void log_fallback(std::string_view role, std::string_view missing, std::string_view used);
    void log_spec(const specs::ModelSpec& spec);
    void log_message(const std::string& msg);
    void log_warning(const std::string& msg);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(ConversionLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        ConversionLogger* mLogger;

        friend class ConversionLogger;
    };

    RAII_Section log_section_start(const std::string& info);
    void log_section_end();

    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

private:
    void log_line(std::string_view line);

    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    EVerbosity mVerbosity;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we save intermediaries
    std::string mSectionInfo;
    std::chrono::steady_clock::time_point mSectionStart;
};

} // namespace nmtspec

#endif //NMTSPEC_SRC_UTILITIES_LOGGING_H
