#include "core/concat_job.hpp"
#include "io/output_file.hpp"
#include "metrics/timers.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

using std::string;
namespace fs = std::filesystem;

int main(int argc, char** argv){
  // Defaults
  std::vector<fs::path> inputs;
  string outPath = "/dev/null";
  std::vector<size_t> chunkSizes = {64u<<10, 1u<<20, 4u<<20, 16u<<20};
  long long repeat = 4;
  bool threaded = false;

  // Supported:
  //   --out <file>          | --out=<file>
  //   --chunk-bytes <N>     (repeatable; replaces the default sweep)
  //   --repeat <N>
  //   --threaded
  //   positional input files
  bool customChunks = false;
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);
    auto need = [&](std::string_view name)->const char*{
      if (i+1<argc) return argv[++i];
      fmt::print(stderr, "missing value for {}\n", name);
      return nullptr;
    };

    if (a.rfind("--out=",0)==0) {
      outPath = string(a.substr(6));
    } else if (a == "--out") {
      const char* v = need("--out"); if (!v) return 2; outPath = v;
    } else if (a == "--chunk-bytes") {
      const char* v = need("--chunk-bytes"); if (!v) return 2;
      if (!customChunks){ chunkSizes.clear(); customChunks = true; }
      chunkSizes.push_back(static_cast<size_t>(std::stoull(v)));
    } else if (a == "--repeat") {
      const char* v = need("--repeat"); if (!v) return 2;
      repeat = std::stoll(v);
    } else if (a == "--threaded") {
      threaded = true;
    } else if (a.size() && a[0] != '-') {
      inputs.emplace_back(string(a));
    } else {
      fmt::print(stderr, "unknown flag {}\n", a);
      return 2;
    }
  }

  if (inputs.empty()){
    fmt::print(stderr,
      "usage:\n"
      "  repcat_bench <file>... [--out PATH] [--chunk-bytes N]... [--repeat N] [--threaded]\n");
    return 2;
  }

  try {
    for (size_t chunk : chunkSizes){
      repcat::concat_config cfg;
      cfg.outer_repeat = repeat;
      cfg.chunk_capacity = chunk;
      cfg.pipelined = threaded;
      repcat::concat_job job(inputs, cfg);
      repcat::null_progress quiet;

      repcat::WallTimer wt; wt.start();
      const auto res = job.run([&]{ return repcat::output_file::create(outPath); }, quiet);
      wt.stop();

      const double secs = wt.ms()/1000.0;
      fmt::print("bench_concat,chunk={},threaded={},inputs={},bytes={},sec={:.3f},MB/s={:.2f}\n",
                 chunk, threaded ? 1 : 0, res.inputs, res.bytes_written, secs,
                 repcat::mb_per_sec(res.bytes_written, wt.ms()));
    }
  } catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 1;
  }
  return 0;
}
