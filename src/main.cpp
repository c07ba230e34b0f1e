#include <exception>
#include <iostream>

#include "../include/Navigator.hpp"
#include "../include/SimulatorApi.hpp"

// stdout belongs to the simulator protocol; everything human-readable goes to stderr
int main() {
    try {
        SimulatorApi api(std::cin, std::cout);
        Navigator mouse(api, std::cerr);

        RunResult result = mouse.run();
        if (result.status != COMPLETE) {
            std::cerr << "Run aborted after " << result.steps << " steps: "
                      << failReasonName(result.reason) << std::endl;
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
