// Copyright 2024 The Sandpiper Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


// A standalone target used for testing the sandpiper binary. Reads the input
// from the file given as its only argument and writes its coverage counters,
// one byte per location, to $SANDPIPER_COVERAGE_FILE.
//
// Behavior:
//   * An input starting with '!' aborts.
//   * The input "exit" makes the target exit with code 2.
//   * Location 0 is always hit. Location 1 + i is hit iff the input starts
//     with the first i + 1 bytes of "FUZZ". Location 8 + min(size, 7) is hit
//     once per input byte, so longer inputs hit it more often.
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <vector>

namespace {

constexpr size_t kNumLocations = 16;
constexpr char kMagic[] = "FUZZ";

std::vector<uint8_t> ReadFile(const char *path) {
  std::vector<uint8_t> data;
  FILE *f = fopen(path, "rb");
  if (f == nullptr) {
    perror("fopen");
    exit(EXIT_FAILURE);
  }
  uint8_t buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
    data.insert(data.end(), buf, buf + n);
  }
  fclose(f);
  return data;
}

void Hit(uint8_t *counters, size_t location) {
  if (counters[location] != 0xFF) ++counters[location];
}

}  // namespace

int main(int argc, char **argv) {
  if (argc != 2) {
    fprintf(stderr, "usage: %s <input_file>\n", argv[0]);
    return EXIT_FAILURE;
  }
  const std::vector<uint8_t> data = ReadFile(argv[1]);

  uint8_t counters[kNumLocations] = {};
  Hit(counters, 0);
  for (size_t i = 0; i < strlen(kMagic) && i < data.size(); ++i) {
    if (data[i] != kMagic[i]) break;
    Hit(counters, 1 + i);
  }
  const size_t size_location = 8 + (data.size() < 7 ? data.size() : 7);
  for (size_t i = 0; i < data.size(); ++i) Hit(counters, size_location);

  // Coverage is written before any fault, as an instrumented target would.
  if (const char *coverage_path = getenv("SANDPIPER_COVERAGE_FILE")) {
    FILE *f = fopen(coverage_path, "wb");
    if (f == nullptr) {
      perror("fopen");
      return EXIT_FAILURE;
    }
    fwrite(counters, 1, sizeof(counters), f);
    fclose(f);
  }

  if (!data.empty() && data[0] == '!') {
    fprintf(stderr, "found the bang\n");
    abort();
  }
  if (data.size() == 4 && memcmp(data.data(), "exit", 4) == 0) return 2;
  return EXIT_SUCCESS;
}
