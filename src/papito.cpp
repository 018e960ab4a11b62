#include "papito.h"

#include <papi.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

struct PapitoState {
    int event_set = PAPI_NULL;
    std::vector<int> codes;
    std::vector<std::string> names;
    bool inited = false;
    bool running = false;
    bool multiplex_available = false;
    bool multiplexed = false;
};

static PapitoState state;

static const char *DEFAULT_COUNTERS_FILE = "counters.in";

static void die_with_msg(const std::string &s) {
    std::cerr << "[papito][FATAL] " << s << std::endl;
    std::exit(1);
}
static void warn_msg(const std::string &s) { std::cerr << "[papito][WARN] " << s << std::endl; }
static void info_msg(const std::string &s) { std::cerr << "[papito][INFO] " << s << std::endl; }

static std::string trim(const std::string &s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

static std::vector<std::string> read_counters_file(const std::string &path) {
    std::vector<std::string> events;
    std::ifstream in(path);
    if (!in.is_open()) {
        warn_msg("Could not open counters file: " + path + " (errno=" + std::to_string(errno) + ")");
        return events;
    }
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        events.push_back(t);
    }
    return events;
}

static bool lookup_event(const std::string &name, int &code) {
    if (PAPI_event_name_to_code(const_cast<char *>(name.c_str()), &code) == PAPI_OK) return true;
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return PAPI_event_name_to_code(const_cast<char *>(upper.c_str()), &code) == PAPI_OK;
}

// Adds one event; on failure switches the event set to multiplexing (once)
// and retries. The first event must be added before multiplexing can be set
// because it binds the event set to a component.
static bool add_event(const std::string &name, int code) {
    int ret = PAPI_add_event(state.event_set, code);
    if (ret != PAPI_OK && !state.multiplexed && state.multiplex_available) {
        int mret = PAPI_set_multiplex(state.event_set);
        if (mret == PAPI_OK) {
            state.multiplexed = true;
            info_msg("Multiplexing enabled while adding " + name);
            ret = PAPI_add_event(state.event_set, code);
        } else {
            warn_msg(std::string("PAPI_set_multiplex failed: ") + PAPI_strerror(mret));
        }
    }
    if (ret != PAPI_OK) {
        warn_msg("Failed to add event '" + name + "': " + PAPI_strerror(ret));
        return false;
    }
    state.codes.push_back(code);
    state.names.push_back(name);
    return true;
}

static void build_event_set(const std::string &path) {
    auto events = read_counters_file(path);
    if (events.empty()) {
        warn_msg("No events read from '" + path + "'. Kernels will run without counters.");
        return;
    }

    int ret = PAPI_create_eventset(&state.event_set);
    if (ret != PAPI_OK) {
        die_with_msg(std::string("PAPI_create_eventset failed: ") + PAPI_strerror(ret));
    }

    for (const auto &name : events) {
        int code = 0;
        if (!lookup_event(name, code)) {
            warn_msg("Event not available (skipping): " + name);
            continue;
        }
        add_event(name, code);
    }

    if (state.codes.empty()) {
        warn_msg("No events could be added. Kernels will run without counters.");
    } else {
        info_msg("Events: " + std::to_string(state.codes.size()) +
                 ", multiplexing " + (state.multiplexed ? "ON" : "OFF"));
    }
}

void papito_init() {
    if (state.inited) return;

    int retval = PAPI_library_init(PAPI_VER_CURRENT);
    if (retval != PAPI_VER_CURRENT && retval > 0) {
        die_with_msg("PAPI_library_init version mismatch");
    } else if (retval < 0) {
        die_with_msg("PAPI_library_init failed");
    }

    const PAPI_hw_info_t *hw = PAPI_get_hardware_info();
    if (hw) {
        info_msg(std::string("CPU: ") + hw->model_string + ", hardware counters: " +
                 std::to_string(PAPI_num_hwctrs()));
    }

    int mret = PAPI_multiplex_init();
    state.multiplex_available = (mret == PAPI_OK);
    if (!state.multiplex_available) {
        warn_msg(std::string("PAPI_multiplex_init() failed: ") + PAPI_strerror(mret));
    }

    const char *envp = std::getenv("PAPITO_COUNTERS");
    std::string counters_file = envp ? std::string(envp) : std::string(DEFAULT_COUNTERS_FILE);
    info_msg("Reading counters from: " + counters_file);
    build_event_set(counters_file);

    state.inited = true;
}

void papito_start() {
    if (!state.inited) papito_init();
    if (state.running || state.codes.empty()) return;

    int ret = PAPI_start(state.event_set);
    if (ret != PAPI_OK) {
        warn_msg(std::string("PAPI_start failed: ") + PAPI_strerror(ret));
        return;
    }
    state.running = true;
}

void papito_end(const std::string &label) {
    if (!state.running) return;
    state.running = false;

    std::vector<long long> values(state.codes.size(), 0LL);
    int ret = PAPI_stop(state.event_set, values.data());
    if (ret != PAPI_OK) {
        warn_msg(std::string("PAPI_stop failed for ") + label + ": " + PAPI_strerror(ret));
        return;
    }

    // stderr keeps stdout free for matrix output
    std::cerr << "PAPITO_COUNTERS\t" << label;
    for (const auto &name : state.names) std::cerr << "\t" << name;
    std::cerr << std::endl;

    std::cerr << "PAPITO_VALUES\t" << label;
    for (long long v : values) std::cerr << "\t" << v;
    std::cerr << std::endl;
}

void papito_finalize() {
    if (!state.inited) return;
    if (state.event_set != PAPI_NULL) {
        PAPI_cleanup_eventset(state.event_set);
        PAPI_destroy_eventset(&state.event_set);
        state.event_set = PAPI_NULL;
    }
    PAPI_shutdown();
    state = PapitoState();
    info_msg("papito finalized.");
}
