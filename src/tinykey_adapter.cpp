#include <iostream>
#include <string>

#include "tinykey/adapter_protocol.hpp"

int main() {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        std::cout << tinykey::HandleRequestLine(line) << "\n";
        std::cout.flush();
    }

    return 0;
}
