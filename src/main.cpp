#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "msgbridge/bridge.hpp"
#include "msgbridge/config.hpp"
#include "msgbridge/metrics.hpp"

namespace {

using namespace msgbridge;

void print_usage() {
  std::cout
      << "msgbridge - file mailbox bridge to a WhatsApp automation service\n\n"
      << "Usage:\n"
      << "  msgbridge onboard\n"
      << "  msgbridge status [--json]\n"
      << "  msgbridge watch\n"
      << "  msgbridge send --to PHONE --message TEXT\n"
      << "  msgbridge listen --id ID [--phone NUMBER]... [--command CMD]\n"
      << "  msgbridge unlisten --id ID\n"
      << "  msgbridge metrics [--json]\n"
      << "  msgbridge --version\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

std::vector<std::string> get_flag_values(const std::vector<std::string>& args, const std::string& flag) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      out.push_back(args[i + 1]);
    }
  }
  return out;
}

int report(const BridgeResult& r) {
  if (r) {
    return 0;
  }
  std::cerr << "Error (" << error_kind_name(r.kind) << "): " << r.message << "\n";
  return 1;
}

void print_status(const SessionStatus& s) {
  std::cout << "Status: " << s.status << " (" << session_state_name(s.state) << ")\n";
  std::cout << "Updated: " << s.timestamp << "\n";
  std::cout << "Authenticated: " << (s.is_authenticated ? "yes" : "no") << "\n";
  std::cout << "Client ready: " << (s.is_client_ready ? "yes" : "no") << "\n";
  std::cout << "Initializing: " << (s.is_initializing ? "yes" : "no") << "\n";
}

void print_message(const std::string& listener_id, const InboundMessage& m) {
  std::cout << "[" << listener_id << "] " << (m.from_me ? "me -> " + m.to : m.from) << " @ " << m.timestamp
            << ": " << m.content << "\n";
}

// Flushes metrics every five seconds until the user presses Enter.
void wait_for_enter(const fs::path& data_dir) {
  MetricsFlusher flusher(data_dir);
  flusher.start();
  std::string ignored;
  std::getline(std::cin, ignored);
  flusher.stop();
}

int run_onboard() {
  const auto config_path = get_config_path();
  if (!config_path) {
    std::cerr << "Cannot resolve home directory for the config file.\n";
    return 1;
  }
  if (fs::exists(*config_path)) {
    std::cout << "Config already exists: " << config_path->string() << "\n";
    return 0;
  }
  if (!save_default_config(*config_path)) {
    std::cerr << "Failed to write config: " << config_path->string() << "\n";
    return 1;
  }
  std::cout << "Created config: " << config_path->string() << "\n";
  return 0;
}

int run_status(const BridgeConfig& cfg, const std::vector<std::string>& args) {
  AutomationBridge bridge(cfg);
  SessionStatus status;
  if (const BridgeResult r = bridge.refresh_status(&status); !r) {
    return report(r);
  }
  if (has_flag(args, "--json")) {
    std::cout << status.to_json().dump(2) << "\n";
    return 0;
  }
  std::cout << "Mailbox: " << bridge.mailbox()->dir().string() << "\n";
  print_status(status);
  return 0;
}

int run_watch(const BridgeConfig& cfg) {
  AutomationBridge bridge(cfg);
  bridge.events().subscribe_status([](const SessionStatus& s) {
    std::cout << "[" << kStatusChangedEvent << "] " << s.to_json().dump() << "\n";
  });
  bridge.events().subscribe_qr([](const std::string& qr) {
    std::cout << "[" << kQrUpdatedEvent << "] " << qr << "\n";
  });

  if (const BridgeResult r = bridge.initialize(); !r) {
    return report(r);
  }
  std::cout << "Watching " << bridge.mailbox()->dir().string() << ". Press Enter to stop.\n";
  wait_for_enter(bridge.data_dir());
  bridge.shutdown();
  return 0;
}

int run_send(const BridgeConfig& cfg, const std::vector<std::string>& args) {
  const std::string to = trim(get_flag_value(args, "--to"));
  const std::string message = get_flag_value(args, "--message");
  if (to.empty() || trim(message).empty()) {
    std::cerr << "Usage: msgbridge send --to PHONE --message TEXT\n";
    return 1;
  }

  AutomationBridge bridge(cfg);
  if (const BridgeResult r = bridge.refresh_status(); !r) {
    return report(r);
  }
  if (const int rc = report(bridge.send_message(to, message)); rc != 0) {
    return rc;
  }
  std::cout << "Message sent to " << mask_phone_number(to) << "\n";
  return 0;
}

int run_listen(const BridgeConfig& cfg, const std::vector<std::string>& args) {
  const std::string id = trim(get_flag_value(args, "--id"));
  if (id.empty()) {
    std::cerr << "Usage: msgbridge listen --id ID [--phone NUMBER]... [--command CMD]\n";
    return 1;
  }
  const std::vector<std::string> phones = get_flag_values(args, "--phone");
  const std::string command = get_flag_value(args, "--command");

  AutomationBridge bridge(cfg);
  bridge.events().subscribe_message(&print_message);
  if (const BridgeResult r = bridge.listen(id, phones, command); !r) {
    return report(r);
  }
  std::cout << "Listening as " << id << ". Press Enter to stop.\n";
  wait_for_enter(bridge.data_dir());

  const BridgeResult removed = bridge.stop_listener(id);
  bridge.shutdown();
  return report(removed);
}

int run_unlisten(const BridgeConfig& cfg, const std::vector<std::string>& args) {
  const std::string id = trim(get_flag_value(args, "--id"));
  if (id.empty()) {
    std::cerr << "Usage: msgbridge unlisten --id ID\n";
    return 1;
  }
  AutomationBridge bridge(cfg);
  return report(bridge.stop_listener(id));
}

int run_metrics(const BridgeConfig& cfg, const std::vector<std::string>& args) {
  const auto data_dir = resolve_data_dir(cfg);
  if (!data_dir) {
    std::cerr << "Cannot resolve the application data directory.\n";
    return 1;
  }
  const std::string raw = read_text_file(metrics_path(*data_dir));
  if (has_flag(args, "--json")) {
    std::cout << (trim(raw).empty() ? "{}" : raw) << "\n";
    return 0;
  }
  std::cout << (trim(raw).empty() ? "(no metrics snapshot yet)\n" : raw + "\n");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];

  if (command == "--version" || command == "-v") {
    std::cout << "msgbridge v0.1.0\n";
    return 0;
  }
  if (command == "onboard") {
    return run_onboard();
  }

  const BridgeConfig cfg = load_config();
  apply_logging(cfg.logging);
  std::vector<std::string> sub(args.begin() + 2, args.end());

  if (command == "status") {
    return run_status(cfg, sub);
  }
  if (command == "watch") {
    return run_watch(cfg);
  }
  if (command == "send") {
    return run_send(cfg, sub);
  }
  if (command == "listen") {
    return run_listen(cfg, sub);
  }
  if (command == "unlisten") {
    return run_unlisten(cfg, sub);
  }
  if (command == "metrics") {
    return run_metrics(cfg, sub);
  }

  print_usage();
  return 1;
}
