#include <cstdio>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

#include <omp.h>

#include "papito.h"
#include "matrix_utils.h"
#include "dispatch_kernels.h"
#include "runner.h"

// Function to print the matrix to stdout
static void print_matrix(const Matrix& M) {
    for (int y = 0; y < M.rows(); ++y) {
        for (int x = 0; x < M.cols(); ++x) {
            printf("%.6f\n", M.get(y, x));
        }
    }
}

static void usage(const char *prg) {
    fprintf(stderr, "Usage: %s M N K mode seed [--check] [--print-matrix] "
                    "[--trials T] [--warmups W] [--threads P]\n", prg);
    fprintf(stderr, "Modes: all");
    for (const auto& k : all_kernels()) fprintf(stderr, ", %s", k.name);
    fprintf(stderr, "\n");
}

struct Options {
    int M = 0, N = 0, K = 0;
    std::string mode;
    unsigned int seed = 0;
    bool check = false;
    bool print_output_matrix = false;
    int trials = 3;
    int warmups = 1;
    int threads = 0; // 0 keeps the OpenMP default
};

static bool parse_options(const std::vector<std::string>& args, Options& o) {
    o.M = std::stoi(args[1]);
    o.N = std::stoi(args[2]);
    o.K = std::stoi(args[3]);
    o.mode = args[4];
    if (!parse_seed(args[5], o.seed)) {
        fprintf(stderr, "Error: seed must be an integer in [0, %u].\n", UINT_MAX);
        return false;
    }

    for (size_t i = 6; i < args.size(); ++i) {
        const std::string& a = args[i];
        bool has_value = i + 1 < args.size();
        if (a == "--check") o.check = true;
        else if (a == "--print-matrix") o.print_output_matrix = true;
        else if (a == "--trials" && has_value) o.trials = std::stoi(args[++i]);
        else if (a == "--warmups" && has_value) o.warmups = std::stoi(args[++i]);
        else if (a == "--threads" && has_value) o.threads = std::stoi(args[++i]);
        else {
            fprintf(stderr, "Error: Unknown or incomplete option '%s'.\n", a.c_str());
            return false;
        }
    }
    if (o.M <= 0 || o.N <= 0 || o.K <= 0) {
        fprintf(stderr, "Error: M, N and K must be positive.\n");
        return false;
    }
    if (o.trials <= 0 || o.warmups < 0 || o.threads < 0) {
        fprintf(stderr, "Error: trials must be positive, warmups and threads non-negative.\n");
        return false;
    }
    return true;
}

static int run(const Options& o) {
    // --- Kernel selection ---
    std::vector<const KernelInfo*> selected;
    if (o.mode == "all") {
        for (const auto& k : all_kernels()) {
            if (shape_supported(k, o.M, o.N, o.K)) selected.push_back(&k);
            else fprintf(stderr, "Skipping %s: M, N, K must be multiples of %d, %d, %d.\n",
                         k.name, k.m_multiple, k.n_multiple, k.k_multiple);
        }
    } else {
        const KernelInfo* k = find_kernel(o.mode);
        if (!k) {
            fprintf(stderr, "Error: Unknown mode '%s'.\n", o.mode.c_str());
            return 1;
        }
        if (!shape_supported(*k, o.M, o.N, o.K)) {
            fprintf(stderr, "Error: For mode %s, M, N, K must be multiples of %d, %d, %d.\n",
                    k->name, k->m_multiple, k->n_multiple, k->k_multiple);
            return 1;
        }
        selected.push_back(k);
    }

    if (o.threads > 0) omp_set_num_threads(o.threads);

    Matrix A = Matrix::random(o.M, o.K, o.seed);
    Matrix B = Matrix::random(o.K, o.N, o.seed + 1);
    Matrix C = Matrix::zeros(o.M, o.N);

    if (o.check) {
        if (!check_all(A, B)) {
            fprintf(stderr, "check: FAILED\n");
            return 2;
        }
        fprintf(stderr, "check: all kernels match naive\n");
    }

    papito_init();

    double baseline = 0.0;
    for (const KernelInfo* k : selected) {
        papito_start();
        BenchResult r = run_benchmark(*k, C, A, B, o.warmups, o.trials);
        papito_end(r.name);

        if (k->fn == kernel_naive) baseline = r.seconds;
        std::string speedup = format_speedup(baseline, r.seconds);

        // All logging and summary info goes to stderr
        fprintf(stderr, "SUMMARY\tM=%d\tN=%d\tK=%d\tmode=%s\tseed=%u\tthreads=%d\tseconds=%g\t"
                        "gflops=%.3f\tspeedup=%s\tchecksum=%.9g\n",
                o.M, o.N, o.K, r.name.c_str(), o.seed, omp_get_max_threads(), r.seconds,
                r.gflops, speedup.c_str(), r.checksum);
    }

    papito_finalize();

    // If requested, print the final matrix to stdout
    if (o.print_output_matrix) {
        print_matrix(C);
    }
    return 0;
}

int main(int argc, char **argv) {
    if (argc < 6) { usage(argv[0]); return 1; }

    std::vector<std::string> args(argv, argv + argc);
    Options o;
    try {
        if (!parse_options(args, o)) { usage(argv[0]); return 1; }
        return run(o);
    } catch (const std::bad_alloc&) {
        fprintf(stderr, "alloc: failed to allocate %dx%dx%d matrices\n", o.M, o.N, o.K);
        return 1;
    } catch (const std::logic_error& e) {
        // std::stoi on malformed arguments
        fprintf(stderr, "Error: Invalid argument (%s).\n", e.what());
        usage(argv[0]);
        return 1;
    }
}
