// Copyright (c) 2024 liudegui. MIT License.
//
// pgs_demo.cpp -- persistent process group walkthrough.
//
// Demonstrates:
//   1. Loading SupervisorConfig from a file (any enabled format)
//   2. Create + Wait + Logs on a short-lived group
//   3. Remove one member of a long-running group, then Close it
//   4. Open after restart and the event log history
//
// Usage: pgs_demo [config-file]

#include "pgs/config.hpp"
#include "pgs/log.hpp"
#include "pgs/registry.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

static pgs::Command Cmd(std::vector<std::string> args) {
  return pgs::Command(std::move(args));
}

static int Report(const char* what, const pgs::Error& err) {
  std::fprintf(stderr, "%s failed [%s]: %s\n", what, pgs::ErrorCodeName(err.code),
               err.what());
  return 1;
}

static pgs::Result<pgs::SupervisorConfig> LoadConfig(int argc, char* argv[]) {
#ifdef PGS_CONFIG_HAS_BACKEND
  if (argc > 1) {
    pgs::MultiConfig file;
    pgs::Status st = file.LoadFile(argv[1]);
    if (!st) return pgs::Result<pgs::SupervisorConfig>::error(st.get_error());
    return pgs::LoadSupervisorConfig(file);
  }
#else
  if (argc > 1) {
    std::fprintf(stderr, "no config backend compiled in, ignoring %s\n", argv[1]);
  }
#endif
  pgs::ConfigStore defaults;
  defaults.Set("supervisor", "root", "/tmp/pgs_demo");
  return pgs::LoadSupervisorConfig(defaults);
}

// ============================================================================
// Demo 1: short-lived group
// ============================================================================

static int DemoEcho(pgs::Registry& reg) {
  printf("\n=== Demo 1: Create / Wait / Logs ===\n");
  pgs::Command hello = Cmd({"sh", "-c", "echo hello from pgs; echo warn 1>&2"});
  pgs::Status st = reg.Create("hello", {hello});
  if (!st && st.get_error().code == pgs::ErrorCode::kAlreadyExists) {
    // Closed by an earlier run; its definition is still persisted.
    auto reopened = reg.Open("hello");
    if (!reopened) return Report("Open", reopened.get_error());
  } else if (!st) {
    return Report("Create", st.get_error());
  }
  st = reg.Wait("hello");
  if (!st) return Report("Wait", st.get_error());

  auto id = pgs::GetCommandId(hello);
  if (!id) return Report("GetCommandId", id.get_error());
  for (int stream : {1, 2}) {
    auto scanner = reg.Logs(id.value(), stream);
    if (!scanner) return Report("Logs", scanner.get_error());
    while (scanner.value().Scan()) {
      printf("  [%s] %s\n", stream == 1 ? "stdout" : "stderr",
             scanner.value().Text().c_str());
    }
  }
  st = reg.Close("hello");
  return st ? 0 : Report("Close", st.get_error());
}

// ============================================================================
// Demo 2: long-running group
// ============================================================================

static int DemoSleepers(pgs::Registry& reg) {
  printf("\n=== Demo 2: Remove / Close ===\n");
  pgs::Command a = Cmd({"sleep", "60"});
  pgs::Command b = Cmd({"sleep", "61"});
  pgs::Command c = Cmd({"sleep", "62"});
  pgs::Status st = reg.Create("sleepers", {a, b, c});
  if (!st) return Report("Create", st.get_error());

  st = reg.Remove("sleepers", {b});
  if (!st) return Report("Remove", st.get_error());

  auto cmds = reg.Commands("sleepers");
  if (cmds) {
    for (const auto& info : *cmds) {
      printf("  %.12s pid=%d %s\n", info.id.c_str(), static_cast<int>(info.pid),
             pgs::DescribeCommand(info.command).c_str());
    }
  }
  st = reg.Close("sleepers");
  return st ? 0 : Report("Close", st.get_error());
}

// ============================================================================
// Demo 3: reopen and history
// ============================================================================

static int DemoReopen(pgs::Registry& reg) {
  printf("\n=== Demo 3: Open / History ===\n");
  auto cmds = reg.Open("sleepers");
  if (!cmds) return Report("Open", cmds.get_error());
  printf("  reopened %zu command(s)\n", cmds.value().size());

  pgs::Status st = reg.Remove("sleepers");
  if (!st) return Report("Remove", st.get_error());

  auto hist = reg.History("sleepers");
  if (!hist) return Report("History", hist.get_error());
  for (const auto& e : hist.value()) {
    printf("  #%lld %-16s %.12s\n", static_cast<long long>(e.seq), e.action.c_str(),
           e.command_id.c_str());
  }
  st = reg.Close("sleepers");
  return st ? 0 : Report("Close", st.get_error());
}

int main(int argc, char* argv[]) {
  auto cfg = LoadConfig(argc, argv);
  if (!cfg) return Report("loading config", cfg.get_error());

  pgs::log::Init();
  pgs::log::SetLevel(cfg.value().log_level);

  auto reg = pgs::Registry::Init(cfg.value());
  if (!reg) return Report("Registry::Init", reg.get_error());

  int rc = DemoEcho(*reg.value());
  if (rc == 0) rc = DemoSleepers(*reg.value());
  if (rc == 0) rc = DemoReopen(*reg.value());

  pgs::log::Shutdown();
  return rc;
}
