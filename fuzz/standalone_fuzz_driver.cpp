// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Standalone driver: replays corpus files through a fuzz target when
// libFuzzer is not available

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

static bool RunFile(const char* path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        fprintf(stderr, "Error: Cannot open file '%s'\n", path);
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        fprintf(stderr, "Error: Cannot read file '%s'\n", path);
        return false;
    }

    int result = LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    printf("%s (%zd bytes): returned %d\n", path, size, result);
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file>...\n", argv[0]);
        fprintf(stderr, "\nFor coverage-guided fuzzing, configure with\n");
        fprintf(stderr, "  -DPEERLINK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++\n");
        return 1;
    }

    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        if (!RunFile(argv[i])) ++failures;
    }
    return failures == 0 ? 0 : 1;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
