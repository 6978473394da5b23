#include "ImbalanceExceptions.h"
#include "ResampleConfig.h"
#include "ResamplePipeline.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        std::cout << ResampleConfig::usage() << "\n";
        return 0;
    }

    try {
        const ResampleConfig config = ResampleConfig::fromArgs(argc, argv);
        ResamplePipeline pipeline;
        return pipeline.run(config);
    } catch (const Imbalance::ImbalanceException& e) {
        std::cerr << "[Imbalance Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Imbalance Exception] " << e.what() << "\n";
        return 1;
    }
}
