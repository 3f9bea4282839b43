#ifndef MIRAGE_CLI_OPTIONS_HPP
#define MIRAGE_CLI_OPTIONS_HPP

#include "mirage_config.hpp"

#include <string>
#include <unordered_map>

namespace mirage {

    // Very small CLI parser:
    //   <command> --key value
    //   --flag (treated as "true")
    class CliParser {
    public:
        void parse(int argc, char** argv);
        const std::string& command() const { return command_; }
        bool has(const std::string& key) const;
        std::string get(const std::string& key, const std::string& def = "") const;
    private:
        std::string command_;
        std::unordered_map<std::string, std::string> kv_;
    };

    struct MakeOptions {
        std::string surfacePath;
        std::string hiddenPath;
        std::string outPath;
        bool report = false;
        ProcessingConfig config;
    };

    // Fill MakeOptions from `mirage make ...`. Prints the offending flag and
    // returns false on a usage error.
    bool parseMakeOptions(const CliParser& cli, MakeOptions& out);

    bool parseInt(const std::string& s, int& out);
    bool parseDouble(const std::string& s, double& out);

}

#endif // MIRAGE_CLI_OPTIONS_HPP
