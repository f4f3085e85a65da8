#include "app/EventQueue.hpp"
#include "app/LogWriter.hpp"
#include "app/ProgressQueue.hpp"
#include "app/StateMachine.hpp"
#include "app/Worker.hpp"
#include "probes/ProbeRegistry.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"

#include <clocale>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <poll.h>
#include <pwd.h>
#include <unistd.h>

using namespace dustpan;

static std::string resolve_home() {
  if (const char* h = std::getenv("HOME"); h && *h) return h;
  if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir && *pw->pw_dir) return pw->pw_dir;
  return {};
}

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      std::printf("Usage: dustpan\n");
      std::printf("Interactive disk cleaner. Config: %s\n", ui::config_file_path().c_str());
      return 0;
    }
    std::fprintf(stderr, "dustpan: unknown argument '%s'\n", a.c_str());
    return 1;
  }

  std::setlocale(LC_ALL, "");
  std::string home = resolve_home();
  if (home.empty()) {
    std::fprintf(stderr, "dustpan: cannot determine home directory\n");
    return 1;
  }
  if (!ui::tty_stdin() || !ui::tty_stdout()) {
    std::fprintf(stderr, "dustpan: stdin and stdout must be a terminal\n");
    return 1;
  }
  std::signal(SIGINT, ui::on_sigint);

  const auto& cfg = ui::config();

  std::unique_ptr<app::LogWriter> log;
  if (cfg.log.enabled) {
    log = std::make_unique<app::LogWriter>(ui::log_dir(cfg));
    log->start();
    log->log("session start home=" + home);
  }

  auto ctx = probes::probe_context_from_env(home);
  ctx.download_age_days = cfg.scan.downloads_age_days;
  ctx.docker_min_bytes = static_cast<uint64_t>(cfg.scan.docker_min_mb) * 1024 * 1024;
  ctx.extra_skip = cfg.scan.extra_skip;

  app::ProgressQueue progress;
  app::EventQueue events;
  app::Worker worker(events);
  app::StateMachine machine(worker,
                            app::MachineOptions{.probe_context = std::move(ctx), .df_command = cfg.disk.command},
                            &progress, log.get());

  bool use_alt = cfg.ui.alt_screen;
  ui::RawTermGuard raw{}; ui::CursorGuard curs{}; ui::AltScreenGuard alt{use_alt};
  std::atexit(&ui::on_atexit_restore);
  ui::best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);

  bool running = true;
  while (running && !ui::g_stop.load()) {
    machine.set_page_rows(ui::detail_viewport_rows(ui::term_rows()));
    ui::render_screen(machine);

    pollfd pfds[2] = {
      {.fd = STDIN_FILENO, .events = POLLIN, .revents = 0},
      {.fd = events.fd(), .events = POLLIN, .revents = 0},
    };
    nfds_t nfds = events.fd() >= 0 ? 2 : 1;
    int rv = ::poll(pfds, nfds, 100);
    if (rv > 0 && (pfds[0].revents & POLLIN)) {
      for (auto k : ui::read_keys(cfg)) {
        if (!machine.on_key(k)) { running = false; break; }
      }
    }
    while (auto ev = events.try_pop()) machine.on_event(std::move(*ev));
    machine.pump_progress();
  }

  if (log) {
    log->log("session end");
    log->stop();
  }
  return 0;
}
