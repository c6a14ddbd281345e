#include "core/config_manager.h"
#include "core/logger.h"
#include "ml/backend/cpu_backend.h"
#include "ml/context.h"
#include "ml/random.h"
#include "ml/tensor.h"
#include "ml/nn/attention.h"
#include "ml/nn/attention_factory.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dualattn;

namespace {

struct DemoOptions {
  std::string configPath;
  std::optional<std::string> variant;
  std::optional<std::string> logLevel;
  std::optional<int> threads;
  std::optional<int> seed;
  int64_t batch = 1;
  int64_t heads = 4;
  int64_t tgtLen = 16;
  int64_t srcLen = 16;
  int64_t headDim = 64;
  bool causal = false;
  bool help = false;
};

void printUsage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n"
      << "  --config PATH        JSON configuration file\n"
      << "  --variant NAME       manual | dispatch\n"
      << "  --batch N            batch size (default 1)\n"
      << "  --heads N            number of heads (default 4)\n"
      << "  --tgt N              query length (default 16)\n"
      << "  --src N              key/value length (default 16)\n"
      << "  --dim N              head dimension (default 64)\n"
      << "  --seed N             input seed (default attention.dropout_seed)\n"
      << "  --threads N          fused kernel threads (0 = auto)\n"
      << "  --causal             apply a causal mask (requires tgt <= src)\n"
      << "  --log-level LEVEL    DEBUG | INFO | WARNING | ERROR | FATAL\n"
      << "  --help               show this message\n";
}

int64_t parseCount(const std::string &flag, const std::string &text,
                   int64_t minValue) {
  size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(text, &used);
  } catch (const std::exception &) {
    throw std::invalid_argument("invalid value for " + flag + ": " + text);
  }
  if (used != text.size() || v < minValue) {
    throw std::invalid_argument("invalid value for " + flag + ": " + text);
  }
  return static_cast<int64_t>(v);
}

DemoOptions parseArgs(int argc, char *argv[]) {
  DemoOptions opts;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    std::string arg = args[i];
    std::optional<std::string> inlineValue;
    const size_t eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      inlineValue = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
    }

    auto value = [&]() -> std::string {
      if (inlineValue) {
        return *inlineValue;
      }
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return args[++i];
    };

    if (arg == "--help" || arg == "-h") {
      opts.help = true;
    } else if (arg == "--config") {
      opts.configPath = value();
    } else if (arg == "--variant") {
      opts.variant = value();
    } else if (arg == "--log-level") {
      opts.logLevel = value();
    } else if (arg == "--batch") {
      opts.batch = parseCount(arg, value(), 1);
    } else if (arg == "--heads") {
      opts.heads = parseCount(arg, value(), 1);
    } else if (arg == "--tgt") {
      opts.tgtLen = parseCount(arg, value(), 0);
    } else if (arg == "--src") {
      opts.srcLen = parseCount(arg, value(), 0);
    } else if (arg == "--dim") {
      opts.headDim = parseCount(arg, value(), 1);
    } else if (arg == "--seed") {
      opts.seed = static_cast<int>(parseCount(arg, value(), 0));
    } else if (arg == "--threads") {
      opts.threads = static_cast<int>(parseCount(arg, value(), 0));
    } else if (arg == "--causal") {
      opts.causal = true;
    } else {
      throw std::invalid_argument("unknown option: " + args[i]);
    }
  }
  if (opts.causal && opts.tgtLen > opts.srcLen) {
    throw std::invalid_argument("--causal needs --tgt <= --src");
  }
  return opts;
}

void configureLogging(const core::ConfigManager &config,
                      const DemoOptions &opts) {
  core::Logger &logger = core::Logger::getInstance();
  const std::string level =
      opts.logLevel ? *opts.logLevel : config.getString("log.level", "INFO");
  logger.setLogLevel(core::parseLogLevel(level, logger.getLogLevel()));
  logger.setConsoleOutput(config.getBool("log.console_output", true));
  const std::string file = config.getString("log.file", "");
  if (!file.empty() && !logger.setLogFile(file)) {
    logger.warning("Cannot open log file " + file);
  }
}

float maxAbsDiff(const ml::Tensor &a, const ml::Tensor &b) {
  const std::vector<float> x = a.toVector();
  const std::vector<float> y = b.toVector();
  float diff = 0.0f;
  for (size_t i = 0; i < x.size() && i < y.size(); ++i) {
    diff = std::max(diff, std::fabs(x[i] - y[i]));
  }
  return diff;
}

int runDemo(const DemoOptions &opts) {
  core::ConfigManager config;
  if (!opts.configPath.empty() && !config.loadConfig(opts.configPath)) {
    std::cerr << "Failed to load config: " << opts.configPath << std::endl;
    return 1;
  }
  if (opts.variant) {
    config.setString("attention.variant", *opts.variant);
  }
  if (opts.threads) {
    config.setInt("attention.num_threads", *opts.threads);
  }
  configureLogging(config, opts);
  core::Logger &logger = core::Logger::getInstance();

  ml::CPUBackend backend;
  if (!backend.initialize()) {
    logger.error("CPU backend failed to initialize");
    return 1;
  }

  ml::Context ctx(&backend);
  ctx.setNumThreads(config.getInt("attention.num_threads", 0));
  ctx.enableProfiling(true);

  const int seed =
      opts.seed ? *opts.seed : config.getInt("attention.dropout_seed", 42);
  ml::RandomSource rng(static_cast<uint64_t>(seed));

  const ml::Tensor q =
      ml::Tensor::randn({opts.batch, opts.heads, opts.tgtLen, opts.headDim}, rng);
  const ml::Tensor k =
      ml::Tensor::randn({opts.batch, opts.heads, opts.srcLen, opts.headDim}, rng);
  const ml::Tensor v =
      ml::Tensor::randn({opts.batch, opts.heads, opts.srcLen, opts.headDim}, rng);

  ml::Tensor mask;
  ml::nn::AttentionConfig attnConfig;
  if (opts.causal) {
    mask = ml::nn::makeCausalMask(opts.tgtLen, opts.srcLen);
    attnConfig.mask = &mask;
  }

  auto op = ml::nn::createAttentionFromConfig(config);
  logger.info("Running " + op->getName() + " on Q " + ml::shapeToString(q.shape()) +
              ", K " + ml::shapeToString(k.shape()) + " with " +
              std::to_string(ctx.numThreads()) + " thread(s)");

  const ml::Tensor out = op->compute(ctx, q, k, v, attnConfig);
  const ml::Tensor ref = ml::nn::AttentionCore().compute(ctx, q, k, v, attnConfig);
  ctx.synchronize();

  std::cout << "operator:      " << op->getName() << std::endl;
  std::cout << "output shape:  " << ml::shapeToString(out.shape()) << std::endl;
  std::cout << "max |diff| vs manual: " << maxAbsDiff(out, ref) << std::endl;
  ctx.printProfilingInfo();
  logger.flush();
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    const DemoOptions opts = parseArgs(argc, argv);
    if (opts.help) {
      printUsage(argv[0]);
      return 0;
    }
    return runDemo(opts);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    printUsage(argv[0]);
    return 1;
  } catch (const std::exception &e) {
    core::Logger &logger = core::Logger::getInstance();
    logger.fatal(std::string("attention_demo aborted: ") + e.what());
    logger.flush();
    return 1;
  }
}
