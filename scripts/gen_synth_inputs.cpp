#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Writes COUNT files of BYTES pseudo-random bytes each into DIR as
// input_0000.bin, input_0001.bin, ... (seeded, so reruns are identical).
int main(int argc, char** argv){
  if (argc < 4){
    std::cerr << "usage: gen_synth_inputs <dir> <count> <bytes_per_file>\n";
    return 2;
  }
  const std::string dir = argv[1];
  const std::uint64_t count = std::strtoull(argv[2], nullptr, 10);
  const std::uint64_t bytes = std::strtoull(argv[3], nullptr, 10);

  std::mt19937_64 rng(42);
  std::vector<char> block(1u << 20);
  for (std::uint64_t i = 0; i < count; ++i){
    char name[32];
    std::snprintf(name, sizeof(name), "input_%04llu.bin", static_cast<unsigned long long>(i));
    const std::string path = dir + "/" + name;
    std::ofstream f(path, std::ios::binary);
    if (!f){ std::cerr << "open failed: " << path << "\n"; return 2; }

    std::uint64_t left = bytes;
    while (left > 0){
      for (std::size_t j = 0; j + 8 <= block.size(); j += 8){
        const std::uint64_t r = rng();
        for (int k = 0; k < 8; ++k) block[j + k] = static_cast<char>((r >> (8 * k)) & 0xff);
      }
      const std::size_t n = left < block.size() ? static_cast<std::size_t>(left) : block.size();
      f.write(block.data(), static_cast<std::streamsize>(n));
      left -= n;
    }
    if (!f){ std::cerr << "write failed: " << path << "\n"; return 2; }
  }
  std::cerr << "wrote " << count << " files of " << bytes << " bytes to " << dir << "\n";
  return 0;
}
