#include "mirage_commands.hpp"
#include "image_stego.hpp"
#include "metrics.hpp"
#include "mirage_pipeline.hpp"
#include "raster_surface.hpp"

#include <iostream>

namespace mirage {

    void printUsage()
    {
        std::cout << "Usage:\n"
                  << "  mirage make --surface <img> --hidden <img> --out <out.png>\n"
                  << "              [--surface-min 0..255] [--hidden-max 0..255] [--color]\n"
                  << "              [--dithering 0..1] [--message TEXT | --message-file PATH]\n"
                  << "              [--width N] [--height N] [--seed N] [--strict] [--report]\n"
                  << "  mirage extract --in <stego.png> [--expect TEXT]\n"
                  << "  mirage capacity --width N --height N\n";
    }

    int runMake(const CliParser& cli)
    {
        MakeOptions opt;
        if (!parseMakeOptions(cli, opt)) {
            printUsage();
            return EXIT_CODE_USAGE;
        }

        metrics::RevealReport report;
        if (!generateMirageFile(opt.surfacePath, opt.hiddenPath, opt.outPath, opt.config,
                                opt.report ? &report : nullptr)) {
            std::cerr << "[ERROR] generation failed\n";
            return EXIT_CODE_RUNTIME;
        }
        if (opt.report) {
            metrics::printReport(report);
        }
        return EXIT_CODE_OK;
    }

    int runExtract(const CliParser& cli)
    {
        const std::string in = cli.get("in");
        if (in.empty()) {
            printUsage();
            return EXIT_CODE_USAGE;
        }

        cv::Mat rgba;
        if (!loadCarrier(in, rgba)) {
            return EXIT_CODE_RUNTIME;
        }

        std::string message;
        if (!stego::extractTextLSB(rgba, message)) {
            std::cerr << "[ERROR] no readable payload in " << in << "\n";
            return EXIT_CODE_RUNTIME;
        }
        std::cout << message << std::endl;

        if (cli.has("expect")) {
            const double ber = metrics::computeBER(cli.get("expect"), message);
            std::cout << "[extract] BER vs expected: " << ber << std::endl;
        }
        return EXIT_CODE_OK;
    }

    int runCapacity(const CliParser& cli)
    {
        int w = 0, h = 0;
        if (!parseInt(cli.get("width"), w) || !parseInt(cli.get("height"), h) ||
            w <= 0 || h <= 0) {
            printUsage();
            return EXIT_CODE_USAGE;
        }

        const size_t bits = stego::capacityBits(w, h);
        const size_t bytes = stego::payloadCapacityBytes(bits);
        std::cout << "[capacity] " << w << "x" << h << ": " << bits << " bits, "
                  << bytes << " payload bytes\n";
        return EXIT_CODE_OK;
    }

    int runCommand(const CliParser& cli)
    {
        const std::string& cmd = cli.command();
        if (cmd == "make") return runMake(cli);
        if (cmd == "extract") return runExtract(cli);
        if (cmd == "capacity") return runCapacity(cli);

        printUsage();
        return (cmd.empty() || cmd == "help" || cli.has("help")) ? EXIT_CODE_OK : EXIT_CODE_USAGE;
    }

}
