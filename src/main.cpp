#include <cstdlib>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config.h"
#include "errors.h"
#include "keys.h"
#include "mouse.h"
#include "transfer.h"
#include "usb.h"

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS]

Lamzu mouse (Atlantis family) configuration tool for Linux.

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit

  -g, --get                Read profile(s) and print them as INI text.
                           Without --profile all four profiles are printed.
  -s, --set FILE           Apply the settings in FILE (INI, '-' = stdin) to
                           the profile selected with --profile, or to the
                           active profile. Only the keys present in FILE
                           are changed.
  -D, --dump               Hex dump the raw profile memory (0x1b00 bytes)

  --get-active             Print the active profile number (1-4)
  --set-active N           Make profile N (1-4) the active profile
  -p, --profile N          Profile to read or write (1-4)

  -c, --config FILE        Read [device] settings (interface, endpoint,
                           timeout_ms, retries) from FILE
  -v, --verbose            Hex dump every frame sent and received

  --list-actions           Print all valid button action and key names

Examples:
  lamzu-ctl --get --profile 1 > profile1.ini
  lamzu-ctl --set profile1.ini --profile 1
  lamzu-ctl --set-active 2
  lamzu-ctl --dump --verbose

Note: Run as root or install a udev rule for non-root access, e.g.
  SUBSYSTEM=="usb", ATTRS{idVendor}=="3554", MODE="0666"
)";
}

// 1-based CLI profile number -> 0-based index
static bool parse_profile_number(const char* arg, int& index) {
    char* end = nullptr;
    long n = std::strtol(arg, &end, 10);
    if (end == arg || *end != '\0' || n < 1 || n > NUM_PROFILES) return false;
    index = static_cast<int>(n - 1);
    return true;
}

static void apply_device_config(const DeviceConfig& dev, UsbSettings& usb, TransferOptions& opts) {
    if (dev.interface)  usb.interface   = *dev.interface;
    if (dev.endpoint)   usb.endpoint_in = *dev.endpoint;
    if (dev.timeout_ms) opts.timeout_ms = *dev.timeout_ms;
    if (dev.retries)    opts.max_retries = *dev.retries;
}

static void dump_blob(const ProfileBlob& blob) {
    std::cout << std::hex << std::setfill('0');
    for (size_t row = 0; row < blob.size(); row += 16) {
        std::cout << std::setw(4) << row << ": ";
        for (size_t i = row; i < row + 16 && i < blob.size(); ++i)
            std::cout << std::setw(2) << static_cast<int>(blob[i]) << " ";
        std::cout << "\n";
    }
    std::cout << std::dec << std::setfill(' ');
}

static void print_profile(int index, const Profile& profile) {
    std::cout << "# Profile " << index + 1 << "\n";
    write_profile_ini(std::cout, profile);
}

int main(int argc, char* argv[]) {
    static const option long_opts[] = {
        {"help",          no_argument,       nullptr, 'h'},
        {"version",       no_argument,       nullptr, 'V'},
        {"get",           no_argument,       nullptr, 'g'},
        {"set",           required_argument, nullptr, 's'},
        {"dump",          no_argument,       nullptr, 'D'},
        {"profile",       required_argument, nullptr, 'p'},
        {"config",        required_argument, nullptr, 'c'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"get-active",    no_argument,       nullptr, 1001},
        {"set-active",    required_argument, nullptr, 1002},
        {"list-actions",  no_argument,       nullptr, 1003},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested operations ----
    bool        do_get        = false;
    bool        do_dump       = false;
    bool        do_get_active = false;
    int         set_active    = -1;   // -1 = not requested
    int         profile       = -1;   // -1 = active profile
    std::string set_file;
    std::string config_file;

    UsbSettings     usb;
    TransferOptions opts;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVgs:Dp:c:v", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;

        case 'V':
            std::cout << "lamzu-ctl " << VERSION << "\n";
            return 0;

        case 'g':
            do_get = true;
            break;

        case 's':
            set_file = optarg;
            break;

        case 'D':
            do_dump = true;
            break;

        case 'p':
            if (!parse_profile_number(optarg, profile)) {
                std::cerr << "Error: --profile must be 1-" << NUM_PROFILES << "\n";
                return 1;
            }
            break;

        case 'c':
            config_file = optarg;
            break;

        case 'v':
            opts.verbose = true;
            break;

        case 1001:  // --get-active
            do_get_active = true;
            break;

        case 1002:  // --set-active N
            if (!parse_profile_number(optarg, set_active)) {
                std::cerr << "Error: --set-active must be 1-" << NUM_PROFILES << "\n";
                return 1;
            }
            break;

        case 1003:  // --list-actions
            list_actions();
            return 0;

        default:
            std::cerr << "Use --help for usage.\n";
            return 1;
        }
    }

    // ---- validate that there's something to do ----
    bool has_work = do_get || do_dump || do_get_active || set_active >= 0 || !set_file.empty();
    if (!has_work) {
        print_help(argv[0]);
        return 0;
    }

    // ---- parse input files before touching the device ----
    PartialProfile patch;
    try {
        if (!config_file.empty())
            apply_device_config(parse_config_file(config_file).device, usb, opts);

        if (!set_file.empty()) {
            Config cfg = set_file == "-" ? parse_config(std::cin) : parse_config_file(set_file);
            apply_device_config(cfg.device, usb, opts);
            patch = cfg.profile;
            if (patch.empty())
                std::cerr << "Warning: " << set_file << " contains no profile settings\n";
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    int exit_code = 0;

    try {
        // ---- open mouse ----
        // The interface is released again when `transport` goes out of scope.
        UsbTransport transport(usb);
        std::cerr << "Opening Lamzu mouse...\n";
        transport.open();
        std::cerr << "Connected (" << transport.device_id() << "). "
                  << "You may need to move the mouse to wake it up.\n";

        TransferPlanner planner(transport, opts);
        LamzuMouse      mouse(planner);

        // ---- --set FILE ----
        if (!set_file.empty() && !patch.empty()) {
            int target = profile >= 0 ? profile : mouse.active_profile_index();
            std::cerr << "Writing profile " << target + 1 << "...\n";
            mouse.set_profile(target, patch);
            std::cerr << "Profile " << target + 1 << " configured\n";
        }

        // ---- --set-active N ----
        if (set_active >= 0) {
            mouse.set_active_profile_index(set_active);
            std::cerr << "Set active profile to:\n";
            std::cout << set_active + 1 << "\n";
        }

        // ---- --get-active ----
        if (do_get_active) {
            int index = mouse.active_profile_index();
            std::cerr << "Active profile on mouse:\n";
            std::cout << index + 1 << "\n";
        }

        // ---- --get ----
        if (do_get) {
            if (profile >= 0) {
                print_profile(profile, mouse.profile(profile));
            } else {
                auto all = mouse.profiles();
                for (size_t i = 0; i < all.size(); ++i) {
                    if (i > 0) std::cout << "\n";
                    print_profile(static_cast<int>(i), all[i]);
                }
            }
        }

        // ---- --dump ----
        if (do_dump) {
            int target = profile >= 0 ? profile : mouse.active_profile_index();
            std::cerr << "Raw memory of profile " << target + 1 << ":\n";
            dump_blob(mouse.profile_blob(target));
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    return exit_code;
}
