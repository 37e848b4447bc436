#include "asterism/config/EngineConfig.h"
#include "asterism/core/Args.h"
#include "asterism/core/CVar.h"
#include "asterism/core/Log.h"
#include "asterism/core/LogBuffer.h"
#include "asterism/proc/PlanetCharacteristics.h"
#include "asterism/sim/Signature.h"
#include "asterism/sim/Universe.h"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

using namespace asterism;

static void printHelp() {
  std::cout << "asterism_sandbox\n"
            << "  --seed <text>          Root seed (default: \"" << config::kDefaultSeed << "\")\n"
            << "  --config <path>        Load cvars from a file before other options\n"
            << "  --set <name=value>     Override one cvar (repeatable)\n"
            << "  --x <n> --y <n>        Cell to inspect (default: 0 0)\n"
            << "  --system               Print the system at the cell\n"
            << "  --advance <seconds>    Advance its orbits before printing\n"
            << "  --details              Print surface characteristics of each planet\n"
            << "  --signature            Print a stable 64-bit signature of the system\n"
            << "  --stars <radius>       List star cells within a square of this radius\n"
            << "  --nebula <w>x<h>       Dump nebula colours around the cell as hex\n"
            << "  --log-level <level>    trace|debug|info|warn|error|off\n"
            << "  --log-file <path>      Write the captured log to a file on exit\n"
            << "  --save-config <path>   Write the effective cvars to a file\n";
}

static bool parseSize(const std::string& text, int& w, int& h) {
  const auto x = text.find('x');
  if (x == std::string::npos) return false;
  try {
    w = std::stoi(text.substr(0, x));
    h = std::stoi(text.substr(x + 1));
  } catch (const std::exception&) {
    return false;
  }
  return w > 0 && h > 0 && w <= 512 && h <= 512;
}

static void printSystem(const sim::StarSystem& sys) {
  std::cout << sim::describeSystem(sys);
}

static void printDetails(const sim::StarSystem& sys) {
  for (const auto& slot : sys.planets) {
    if (!slot) continue;
    const proc::PlanetCharacteristics c = proc::generateCharacteristics(*slot);
    std::cout << slot->name << " (" << sim::toString(slot->type) << ")\n"
              << "  diameter " << c.diameterKm << " km, density " << c.densityGcm3 << " g/cm3, gravity "
              << c.gravityG << " g\n"
              << "  atmosphere " << proc::toString(c.atmosphere.density) << ", " << c.atmosphere.pressureBar
              << " bar";
    for (const auto& share : c.atmosphere.composition) {
      std::cout << ", " << proc::toString(share.gas) << ' ' << share.percent << '%';
    }
    std::cout << "\n  surface " << c.surfaceTemperatureK << " K\n"
              << "  hydrosphere: " << c.hydrosphere << "\n"
              << "  lithosphere: " << c.lithosphere << "\n"
              << "  minerals: " << proc::toString(c.mineralRichness) << " (" << c.baseMinerals << ")\n";
  }
}

static void dumpNebula(sim::Universe& u, core::i64 cx, core::i64 cy, int w, int h) {
  for (int row = 0; row < h; ++row) {
    for (int col = 0; col < w; ++col) {
      const double wx = static_cast<double>(cx) + (col - w / 2);
      const double wy = static_cast<double>(cy) + (row - h / 2);
      if (col) std::cout << ' ';
      std::cout << render::toHex(u.backgroundColour(wx, wy));
    }
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::LogBuffer logBuffer;
  core::ScopedLogSink capture(logBuffer.sink());

  core::Args args(argc, argv);
  if (args.hasFlag("help") || (args.positional().size() == 1 && args.positional()[0] == "-h")) {
    printHelp();
    return 0;
  }

  int exitCode = 0;

  core::CVarRegistry cvars;
  config::installEngineCVars(cvars);

  std::string path;
  if (args.get("config", path)) {
    std::string err;
    if (!cvars.loadFile(path, &err)) {
      ASTERISM_LOG_ERROR("config: " + err);
      exitCode = 1;
    }
  }

  if (const auto* sets = args.values("set")) {
    for (const auto& s : *sets) {
      const auto eq = s.find('=');
      std::string err;
      if (eq == std::string::npos || !cvars.setFromString(s.substr(0, eq), s.substr(eq + 1), &err)) {
        ASTERISM_LOG_ERROR("--set " + s + ": " + (err.empty() ? std::string("expected name=value") : err));
        exitCode = 1;
      }
    }
  }

  std::string seed;
  std::string level;
  std::string err;
  if (args.get("seed", seed) && !cvars.setString("universe.seed", seed, &err)) {
    ASTERISM_LOG_ERROR("--seed: " + err);
    exitCode = 1;
  }
  if (args.get("log-level", level) && !cvars.setString("log.level", level, &err)) {
    ASTERISM_LOG_ERROR("--log-level: " + err);
    exitCode = 1;
  }

  const config::EngineConfig cfg = config::engineConfigFromCVars(cvars);
  core::setLogLevel(cfg.logLevel);

  std::int64_t x = 0;
  std::int64_t y = 0;
  if (args.has("x") && !args.getInt("x", x)) {
    ASTERISM_LOG_ERROR("--x expects an integer");
    exitCode = 1;
  }
  if (args.has("y") && !args.getInt("y", y)) {
    ASTERISM_LOG_ERROR("--y expects an integer");
    exitCode = 1;
  }

  sim::Universe universe(cfg.seed, cfg.universe);

  const bool wantSystem = args.hasFlag("system") || args.has("advance") || args.hasFlag("signature") ||
                          args.hasFlag("details");
  if (wantSystem) {
    sim::StarSystem& sys = universe.system(x, y);
    if (!universe.hasStarAt(x, y)) {
      std::cout << "(no star charted at " << x << ", " << y << "; showing the generated system anyway)\n";
    }

    double dt = 0.0;
    if (args.has("advance")) {
      if (args.getDouble("advance", dt)) {
        const sim::OrbitReport r = universe.advanceOrbits(sys, dt);
        std::cout << "advanced " << r.updated << " bodies by " << dt << " s";
        if (r.faulted) std::cout << " (" << r.faulted << " faulted)";
        std::cout << "\n";
      } else {
        ASTERISM_LOG_ERROR("--advance expects a number of seconds");
        exitCode = 1;
      }
    }

    if (args.hasFlag("system") || args.has("advance")) printSystem(sys);
    if (args.hasFlag("details")) printDetails(sys);

    if (args.hasFlag("signature")) {
      std::cout << "signature: 0x" << std::hex << std::setw(16) << std::setfill('0')
                << sim::signatureStarSystem(sys) << std::dec << std::setfill(' ') << "\n";
    }
  }

  if (args.has("stars")) {
    std::int64_t radius = 0;
    if (!args.getInt("stars", radius) || radius < 0 || radius > 4096) {
      ASTERISM_LOG_ERROR("--stars expects a radius in [0, 4096]");
      exitCode = 1;
    } else {
      const auto cells = universe.starMap().starsIn(x - radius, y - radius, x + radius, y + radius);
      std::cout << cells.size() << " stars within " << radius << " of (" << x << ", " << y << ")\n";
      for (const auto& c : cells) {
        const sim::StarSystem& s = universe.system(c.x, c.y);
        std::cout << "  (" << c.x << ", " << c.y << ") " << s.name << " class " << sim::toChar(s.starClass)
                  << ", " << s.planetCount() << " planets" << (s.starbase ? ", starbase" : "") << "\n";
      }
    }
  }

  if (args.has("nebula")) {
    std::string size;
    int w = 0;
    int h = 0;
    if (!args.get("nebula", size) || !parseSize(size, w, h)) {
      ASTERISM_LOG_ERROR("--nebula expects <w>x<h> with both in [1, 512]");
      exitCode = 1;
    } else {
      dumpNebula(universe, x, y, w, h);
    }
  }

  if (args.get("save-config", path)) {
    std::string err;
    if (!cvars.saveFile(path, &err)) {
      ASTERISM_LOG_ERROR("save-config: " + err);
      exitCode = 1;
    }
  }

  if (args.get("log-file", path)) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
      std::cerr << "cannot write log file " << path << "\n";
      exitCode = 1;
    } else {
      logBuffer.writeTo(out);
    }
  }

  return exitCode;
}
