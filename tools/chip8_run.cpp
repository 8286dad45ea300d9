// ==============================================================================
// Headless CHIP-8 Runner
// ==============================================================================
// Loads a ROM, runs it for a fixed number of frames without any window or
// audio device, and prints the final display and machine state.
//
// Usage:
//   chip8_run [options] rom.ch8
//
// Options:
//   --frames N            frames to run (default 60)
//   --cycles-per-frame N  cycles per frame (default 5)
//   --seed N              pin the random source
//   --profile NAME        quirk preset: classic, cosmac, chip48, schip
//   --quirk NAME          enable one quirk (repeatable)
//   --timers cycle|frame  timer decrement clock (default cycle)
//   --key K               hold hex key K down for the whole run (repeatable)
//   --trace               print every executed instruction to stderr
//   --skip-faults         resume past faulting instructions instead of stopping
// ==============================================================================

#include "cpu.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace chip8;

namespace {

struct RunOptions {
    EngineConfig config;
    uint64_t frames = 60;
    uint64_t cycles_per_frame = DEFAULT_CYCLES_PER_FRAME;
    std::vector<uint8_t> held_keys;
    bool trace = false;
    bool skip_faults = false;
    std::string rom_path;
};

void usage(const char* progname) {
    std::cerr << "usage: " << progname << " [options] rom.ch8\n"
              << "  --frames N            frames to run (default 60)\n"
              << "  --cycles-per-frame N  cycles per frame (default "
              << DEFAULT_CYCLES_PER_FRAME << ")\n"
              << "  --seed N              pin the random source\n"
              << "  --profile NAME        classic, cosmac, chip48, schip\n"
              << "  --quirk NAME          shift, loadstore, loadstore-x, wrap,\n"
              << "                        jump, jump-nibble, vblank, logic\n"
              << "  --timers cycle|frame  timer decrement clock\n"
              << "  --key K               hold hex key K down\n"
              << "  --trace               print executed instructions\n"
              << "  --skip-faults         resume past faulting instructions\n";
}

uint64_t parse_number(const std::string& option, const std::string& text, int base = 10) {
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, base);
    if (text.empty() || *end != '\0') {
        throw ConfigError(option + " expects a number, got '" + text + "'");
    }
    return value;
}

RunOptions parse_arguments(int argc, char** argv) {
    RunOptions options;
    std::vector<std::string> args(argv + 1, argv + argc);

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg.empty() || arg[0] != '-') {
            if (!options.rom_path.empty()) {
                throw ConfigError("More than one ROM given: '" + arg + "'");
            }
            options.rom_path = arg;
            continue;
        }

        if (arg == "--trace") {
            options.trace = true;
            continue;
        }
        if (arg == "--skip-faults") {
            options.skip_faults = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            throw ConfigError(arg + " option requires a value");
        }
        const std::string& value = args[++i];

        if (arg == "--frames") {
            options.frames = parse_number(arg, value);
        } else if (arg == "--cycles-per-frame") {
            options.cycles_per_frame = parse_number(arg, value);
        } else if (arg == "--seed") {
            options.config.seed = parse_number(arg, value);
        } else if (arg == "--profile") {
            options.config.quirks = quirks_for_profile(value);
        } else if (arg == "--quirk") {
            enable_quirk(options.config.quirks, value);
        } else if (arg == "--timers") {
            options.config.timer_mode = parse_timer_mode(value);
        } else if (arg == "--key") {
            uint64_t key = parse_number(arg, value, 16);
            if (key >= NUM_KEYS) {
                throw ConfigError("--key expects a hex digit 0-F, got '" + value + "'");
            }
            options.held_keys.push_back(static_cast<uint8_t>(key));
        } else {
            throw ConfigError("Unknown option '" + arg + "'");
        }
    }

    if (options.rom_path.empty()) {
        throw ConfigError("No ROM file given");
    }

    return options;
}

// Runs one frame cycle by cycle so each instruction can be traced.
void run_traced_frame(Chip8Engine& chip, uint64_t cycles) {
    for (uint64_t i = 0; i < cycles; i++) {
        Address pc = chip.get_pc();
        std::string text;
        try {
            text = chip.disassemble(pc);
        } catch (const AddressFault&) {
            text = "<past end of RAM>";  // cycle() reports the fault
        }
        std::cerr << format_hex(pc, 3) << "  " << text << "\n";
        if (chip.cycle() == EngineState::ERROR) {
            break;
        }
    }
    chip.frame_tick();
}

}  // namespace

int main(int argc, char** argv) {
    RunOptions options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    Chip8Engine chip(options.config);
    try {
        chip.load_file(options.rom_path);
    } catch (const RomLoadError& e) {
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Loaded " << options.rom_path << " ("
              << chip.memory().program_size() << " bytes), quirks: "
              << quirks_to_string(options.config.quirks) << "\n";

    for (uint8_t key : options.held_keys) {
        chip.set_key(key, true);
    }

    uint64_t faults = 0;
    for (uint64_t frame = 0; frame < options.frames; frame++) {
        if (options.trace) {
            run_traced_frame(chip, options.cycles_per_frame);
        } else {
            chip.run_frame(options.cycles_per_frame);
        }

        if (chip.get_state() == EngineState::ERROR) {
            faults++;
            std::cerr << "frame " << frame << ": " << chip.get_error_message() << "\n";
            if (!options.skip_faults) {
                break;
            }
            chip.resume();
        }
    }

    std::cout << chip.framebuffer().to_string();
    std::cout << chip.dump_state();

    const EngineStats& stats = chip.get_stats();
    std::cout << "Executed " << stats.instructions_executed << " instructions in "
              << stats.frame_count << " frames, " << stats.draw_count << " draws, "
              << stats.stall_cycles << " stalled cycle(s), "
              << faults << " fault(s)\n";

    return chip.get_state() == EngineState::ERROR ? EXIT_FAILURE : EXIT_SUCCESS;
}
