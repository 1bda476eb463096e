#include <wordguard.hpp>
#include <iostream>
#include <string>

using namespace wordguard::api;

int main(int argc, char** argv) {
    try {
        // Optional config file as the first argument
        ProfanityDetector detector;
        if (argc > 1) {
            std::cout << "Loading configuration from " << argv[1] << "..." << std::endl;
            detector = ProfanityDetector::from_config_file(argv[1]);
        }

        std::cout << "Enter text to check (Ctrl-D to quit):" << std::endl;

        std::string line;
        while (std::getline(std::cin, line)) {
            std::string word = detector.extract_profanity(line);
            if (word.empty()) {
                std::cout << "clean" << std::endl;
                continue;
            }

            std::cout << "profane: " << word << std::endl;
            std::cout << "censored: " << detector.censor(line) << std::endl;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
