#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "headless_terminal.hpp"
#include "editor.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <filesystem>
#include <glog/logging.h>

static void usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [--dump] [--rc <file>] [file]\n";
}

static int env_int(const char* name, int fallback) {
  const char* v = std::getenv(name);
  if (!v) return fallback;
  int n = std::atoi(v);
  return n > 0 ? n : fallback;
}

static void setup(Editor& ed, const std::optional<std::filesystem::path>& rc,
                  const std::optional<std::filesystem::path>& path) {
  if (path) ed.open(path);
  if (rc) ed.load_rc(*rc);
  else ed.load_default_rc();
}

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  bool dump = false;
  std::optional<std::filesystem::path> rc;
  std::optional<std::filesystem::path> path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--dump") == 0) dump = true;
    else if (std::strcmp(argv[i], "--rc") == 0 && i + 1 < argc) rc = std::filesystem::path(argv[++i]);
    else if (argv[i][0] == '-') { usage(argv[0]); return 2; }
    else path = std::filesystem::path(argv[i]);
  }

  if (dump) {
    HeadlessTerminal term(env_int("LINES", 24), env_int("COLUMNS", 80));
    Editor ed(term);
    setup(ed, rc, path);
    ed.render();
    std::cout << term.dump();
    return 0;
  }

  // keep glog off the screen while ncurses owns it
  FLAGS_stderrthreshold = google::GLOG_FATAL;
  Terminal t;
  NcursesTerminal term;
  Editor ed(term);
  setup(ed, rc, path);
  ed.run();
  return 0;
}
