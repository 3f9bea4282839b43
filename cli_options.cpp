#include "cli_options.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace mirage {

    void CliParser::parse(int argc, char** argv) {
        command_.clear();
        kv_.clear();
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i] ? argv[i] : "";
            if (a.rfind("--", 0) == 0) {
                std::string key = a.substr(2);
                std::string val = "true";
                if (i + 1 < argc) {
                    std::string next = argv[i + 1] ? argv[i + 1] : "";
                    if (next.rfind("--", 0) != 0) {
                        val = next;
                        ++i;
                    }
                }
                kv_[key] = val;
            } else if (command_.empty()) {
                command_ = a;
            }
        }
    }

    bool CliParser::has(const std::string& key) const {
        return kv_.find(key) != kv_.end();
    }

    std::string CliParser::get(const std::string& key, const std::string& def) const {
        auto it = kv_.find(key);
        if (it == kv_.end()) return def;
        return it->second;
    }

    bool parseInt(const std::string& s, int& out) {
        try {
            size_t used = 0;
            const int v = std::stoi(s, &used);
            if (used != s.size()) return false;
            out = v;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    bool parseDouble(const std::string& s, double& out) {
        try {
            size_t used = 0;
            const double v = std::stod(s, &used);
            if (used != s.size()) return false;
            out = v;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    static bool parseSeed(const std::string& s, uint64_t& out) {
        if (s.empty() || s[0] == '-') return false;
        try {
            size_t used = 0;
            const unsigned long long v = std::stoull(s, &used);
            if (used != s.size()) return false;
            out = static_cast<uint64_t>(v);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    static bool readTextFile(const std::string& path, std::string& out) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs.good()) return false;
        out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        return true;
    }

    bool parseMakeOptions(const CliParser& cli, MakeOptions& out)
    {
        out = MakeOptions();
        out.surfacePath = cli.get("surface");
        out.hiddenPath = cli.get("hidden");
        out.outPath = cli.get("out");
        if (out.surfacePath.empty() || out.hiddenPath.empty() || out.outPath.empty()) {
            std::cerr << "[cli] --surface, --hidden and --out are required\n";
            return false;
        }

        ProcessingConfig& cfg = out.config;

        struct IntFlag { const char* name; int* dst; };
        const IntFlag intFlags[] = {
            { "surface-min", &cfg.surfaceMin },
            { "hidden-max", &cfg.hiddenMax },
            { "width", &cfg.width },
            { "height", &cfg.height },
        };
        for (const auto& f : intFlags) {
            if (cli.has(f.name) && !parseInt(cli.get(f.name), *f.dst)) {
                std::cerr << "[cli] --" << f.name << " expects an integer, got '"
                          << cli.get(f.name) << "'\n";
                return false;
            }
        }

        if (cli.has("dithering") && !parseDouble(cli.get("dithering"), cfg.dithering)) {
            std::cerr << "[cli] --dithering expects a number in [0, 1]\n";
            return false;
        }
        if (cli.has("seed") && !parseSeed(cli.get("seed"), cfg.seed)) {
            std::cerr << "[cli] --seed expects a non-negative integer\n";
            return false;
        }

        if (cli.has("color")) cfg.grayscale = false;
        if (cli.has("strict")) cfg.overflow = OverflowPolicy::Reject;
        out.report = cli.has("report");

        if (cli.has("message") && cli.has("message-file")) {
            std::cerr << "[cli] --message and --message-file are mutually exclusive\n";
            return false;
        }
        if (cli.has("message")) {
            cfg.steganography = cli.get("message");
        } else if (cli.has("message-file")) {
            if (!readTextFile(cli.get("message-file"), cfg.steganography)) {
                std::cerr << "[cli] Cannot read message file: " << cli.get("message-file") << "\n";
                return false;
            }
        }
        return true;
    }

}
