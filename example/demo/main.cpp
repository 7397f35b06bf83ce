// main.cpp - struct_delta Example

#include <struct_delta/value.h>

#include <iostream>

namespace struct_delta {
    void demo_deep_equal();
    void demo_cycles();
    void demo_diff();
    void demo_delta();
    void demo_binary_codec();
}

int main()
{
    using namespace struct_delta;

    std::cout << "=== struct_delta Example ===\n";
    std::cout << "Structural comparison, diff, delta and binary encoding\n\n";

    while (true) {
        std::cout << "\n=== Demos ===\n";
        std::cout << "E. Deep equality and options\n";
        std::cout << "Y. Cyclic graphs\n";
        std::cout << "D. Diff entries\n";
        std::cout << "T. Delta compute / apply\n";
        std::cout << "B. Binary codec\n";
        std::cout << "A. Run all\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice)) {
            break;
        }
        std::cin.ignore();

        switch (choice) {
        case 'E':
        case 'e':
            demo_deep_equal();
            break;
        case 'Y':
        case 'y':
            demo_cycles();
            break;
        case 'D':
        case 'd':
            demo_diff();
            break;
        case 'T':
        case 't':
            demo_delta();
            break;
        case 'B':
        case 'b':
            demo_binary_codec();
            break;
        case 'A':
        case 'a':
            demo_deep_equal();
            demo_cycles();
            demo_diff();
            demo_delta();
            demo_binary_codec();
            break;
        case 'Q':
        case 'q':
            return 0;
        default:
            std::cout << "Unknown choice\n";
            break;
        }
    }

    return 0;
}
