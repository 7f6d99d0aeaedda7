#include "glider_display.hpp"
#include "glider_error.hpp"
#include "protocol.hpp"

#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " set-mode <mode> <x0> <y0> <x1> <y1> [options]\n"
              << "       " << prog << " redraw <x0> <y0> <x1> <y1> [options]\n"
              << "       " << prog << " --demo [options]\n"
              << "       " << prog << " --list-modes\n"
              << "\n"
              << "Glider e-paper display controller (USB HID)\n"
              << "\n"
              << "Options:\n"
              << "  --device <path>   hidraw device node (hidraw backend, default: match VID/PID)\n"
              << "  --vid <hex>       USB vendor ID (default: 0483)\n"
              << "  --pid <hex>       USB product ID (default: 5750)\n"
              << "  --verbose         Print frames and status words\n"
              << "  --list-modes      List display modes\n"
              << "  --demo            Split the screen into three mode regions\n"
              << "  --help            Show this help message\n";
}

static int16_t parse_coord(const std::string& text) {
    size_t pos = 0;
    long value = std::stol(text, &pos, 10);
    if (pos != text.size() ||
        value < std::numeric_limits<int16_t>::min() ||
        value > std::numeric_limits<int16_t>::max()) {
        throw std::out_of_range("Coordinate out of range: " + text);
    }
    return static_cast<int16_t>(value);
}

static uint16_t parse_usb_id(const std::string& text) {
    size_t pos = 0;
    unsigned long value = std::stoul(text, &pos, 16);
    if (pos != text.size() || value > 0xFFFF) {
        throw std::out_of_range("Invalid USB ID: " + text);
    }
    return static_cast<uint16_t>(value);
}

static Rect parse_rect(const std::vector<std::string>& args, size_t first) {
    return {parse_coord(args[first]), parse_coord(args[first + 1]),
            parse_coord(args[first + 2]), parse_coord(args[first + 3])};
}

static void run_demo(Display& display) {
    // Left half: plain 1-bit, e.g. for a terminal
    std::cout << "Left:         FastMonoNoDither" << std::endl;
    display.set_mode(Mode::FastMonoNoDither, {0, 0, 800, 1200});

    // Top right: 1-bit while updating, greyscale once content settles (maps)
    std::cout << "Top right:    AutoNoDither" << std::endl;
    display.set_mode(Mode::AutoNoDither, {800, 0, 1600, 600});

    // Bottom right: dithered 1-bit (video, games)
    std::cout << "Bottom right: FastMonoBayer" << std::endl;
    display.set_mode(Mode::FastMonoBayer, {800, 600, 1600, 1200});
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Parse arguments
    TransportOptions options;
    std::vector<std::string> positional;
    bool do_demo = false;
    bool do_list = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--demo") {
                do_demo = true;
            } else if (arg == "--list-modes") {
                do_list = true;
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--device" && i + 1 < argc) {
                options.device_path = argv[++i];
            } else if (arg == "--vid" && i + 1 < argc) {
                options.vendor_id = parse_usb_id(argv[++i]);
            } else if (arg == "--pid" && i + 1 < argc) {
                options.product_id = parse_usb_id(argv[++i]);
            } else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit((unsigned char)arg[1])) {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            } else {
                positional.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (do_list) {
        for (Mode mode : all_modes()) {
            std::cout << mode_code(mode) << "  " << mode_name(mode) << std::endl;
        }
        return 0;
    }

    // Validate the command before touching the device
    std::string command = positional.empty() ? "" : positional[0];
    Mode mode = Mode::FastMonoNoDither;
    Rect area{0, 0, 0, 0};
    try {
        if (do_demo) {
            if (!positional.empty()) {
                std::cerr << "Error: --demo takes no command" << std::endl;
                return 1;
            }
        } else if (command == "set-mode" && positional.size() == 6) {
            mode = parse_mode(positional[1]);
            area = parse_rect(positional, 2);
        } else if (command == "redraw" && positional.size() == 5) {
            area = parse_rect(positional, 1);
        } else {
            std::cerr << "Error: Please specify a valid command." << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        Display display(options);
        display.set_verbose(verbose);
        display.connect();

        if (do_demo) {
            run_demo(display);
        } else if (command == "set-mode") {
            std::cout << "Setting " << mode_name(mode) << "..." << std::endl;
            display.set_mode(mode, area);
        } else {
            std::cout << "Redrawing..." << std::endl;
            display.redraw(area);
        }
        std::cout << "Done!" << std::endl;

    } catch (const GliderError& e) {
        std::cerr << "Error (" << error_kind_name(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
