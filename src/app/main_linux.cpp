#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/config/chain_config.hpp"
#include "core/crypto/crypto.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/codec.hpp"
#include "core/p2p/node.hpp"
#include "core/service/pet_service.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace {

constexpr std::string_view kDefaultAccount = "Alice";
constexpr std::size_t kDefaultEventWindow = 10;

struct Shell {
  petchain::LocalNode node;
  petchain::ChainConfig config;
  std::map<std::string, std::unique_ptr<petchain::PetService>> sessions;
  std::string current;
};

std::string dev_phrase(std::string_view name) {
  return std::string{petchain::kDevPhrasePrefix} + std::string{name};
}

std::string account_label(const petchain::AccountId& account) {
  return account.value.substr(0, 12);
}

std::vector<std::string> split_words(const std::string& line) {
  std::istringstream in{line};
  std::vector<std::string> words;
  std::string word;
  while (in >> word) {
    words.push_back(word);
  }
  return words;
}

petchain::PetService* session(Shell& shell, const std::string& name) {
  const auto it = shell.sessions.find(name);
  if (it != shell.sessions.end()) {
    return it->second.get();
  }

  auto service = std::make_unique<petchain::PetService>();
  const petchain::Result init = service->init(shell.node, shell.config, dev_phrase(name));
  if (!init.ok) {
    std::cerr << "Cannot open account " << name << ": " << init.message << '\n';
    return nullptr;
  }
  return shell.sessions.emplace(name, std::move(service)).first->second.get();
}

void print_outcome(const petchain::WatchOutcome& outcome) {
  if (outcome.ok()) {
    std::cout << "ok: " << petchain::describe(outcome) << '\n';
  } else if (outcome.rejected()) {
    std::cout << "failed: " << petchain::describe(outcome) << '\n';
  } else {
    std::cout << "unknown: " << petchain::describe(outcome) << " (check with 'pet')\n";
  }
}

void print_pet(Shell& shell, const std::string& name) {
  const petchain::AccountId account = petchain::CryptoEngine::account_for_phrase(dev_phrase(name));
  const auto pet = shell.node.query_pet(account);
  std::cout << name << " (" << account_label(account) << "): ";
  if (!pet.has_value()) {
    std::cout << "no pet\n";
    return;
  }

  std::cout << pet->name << " the " << petchain::to_string(pet->species) << ", id " << pet->id;
  std::cout << ", last fed at " << shell.node.query_feed_time(pet->id);
  const auto slept = shell.node.query_sleep_time(pet->id);
  if (slept.has_value()) {
    std::cout << ", last slept at " << *slept;
  } else {
    std::cout << ", never slept";
  }
  std::cout << '\n';
}

void print_events(const Shell& shell, std::size_t window) {
  const auto records = shell.node.events().recent(window);
  if (records.empty()) {
    std::cout << "No events yet.\n";
    return;
  }
  for (const auto& record : records) {
    std::cout << "#" << record.sequence << " block " << record.block.number << "/" << record.extrinsic_index
              << " h=" << record.height << " " << petchain::describe(record.event) << '\n';
  }
}

void print_status(const Shell& shell) {
  const petchain::NodeStatusReport report = shell.node.status();
  std::cout << petchain::kAppDisplayName << " " << petchain::kAppVersion << " (" << petchain::kBuildRelease
            << ")\n";
  std::cout << "Chain: " << report.chain_id << (report.running ? " running" : " stopped")
            << (report.authoring ? ", authoring\n" : "\n");
  std::cout << "Best block: #" << report.best_block.number << " " << report.best_block.hash.substr(0, 12) << '\n';
  std::cout << "Finalized: #" << report.finalized_block.number << " " << report.finalized_block.hash.substr(0, 12)
            << '\n';
  std::cout << "Height: " << report.height << '\n';
  std::cout << "Pool: " << report.pool_size << " pending, " << report.open_watchers << " open watcher(s)\n";
  std::cout << "Pets: " << report.pet_count << ", events: " << report.event_count << '\n';
  std::cout << "Dropped: " << report.dropped_count << ", invalid: " << report.invalid_count << '\n';
  std::cout << "State root: " << report.state_root << '\n';
}

void print_help() {
  std::cout << "Commands:\n"
               "  use <name>                      act as the dev account //<name>\n"
               "  mint <name> <species> <id>      species: turtle, snake, rabbit\n"
               "  transfer <name>                 give your pet to //<name>\n"
               "  feed | sleep\n"
               "  pet [name]\n"
               "  events [n]\n"
               "  status | help | quit\n";
}

bool parse_pet_id(const std::string& text, petchain::PetId& out) {
  std::uint64_t value = 0;
  if (!petchain::util::parse_uint64(text, value) || value > UINT32_MAX) {
    return false;
  }
  out = static_cast<petchain::PetId>(value);
  return true;
}

// Returns false when the shell should exit.
bool handle(Shell& shell, const std::vector<std::string>& words) {
  const std::string& command = words.front();
  if (command == "quit" || command == "exit") {
    return false;
  }
  if (command == "help") {
    print_help();
    return true;
  }
  if (command == "status") {
    print_status(shell);
    return true;
  }
  if (command == "events") {
    std::uint64_t window = kDefaultEventWindow;
    if (words.size() > 1 && !petchain::util::parse_uint64(words[1], window)) {
      std::cout << "usage: events [n]\n";
      return true;
    }
    print_events(shell, static_cast<std::size_t>(window));
    return true;
  }
  if (command == "pet") {
    print_pet(shell, words.size() > 1 ? words[1] : shell.current);
    return true;
  }
  if (command == "use") {
    if (words.size() != 2) {
      std::cout << "usage: use <name>\n";
      return true;
    }
    if (auto* service = session(shell, words[1])) {
      shell.current = words[1];
      std::cout << "Now acting as " << shell.current << " (" << account_label(service->account()) << ")\n";
    }
    return true;
  }

  petchain::PetService* service = session(shell, shell.current);
  if (service == nullptr) {
    return true;
  }

  if (command == "mint") {
    petchain::PetId id = 0;
    const auto species = words.size() == 4 ? petchain::species_from_string(words[2]) : std::nullopt;
    if (!species.has_value() || !parse_pet_id(words[3], id)) {
      std::cout << "usage: mint <name> <turtle|snake|rabbit> <id>\n";
      return true;
    }
    print_outcome(service->mint(words[1], *species, id));
  } else if (command == "transfer") {
    if (words.size() != 2) {
      std::cout << "usage: transfer <name>\n";
      return true;
    }
    print_outcome(service->transfer(petchain::CryptoEngine::account_for_phrase(dev_phrase(words[1]))));
  } else if (command == "feed") {
    print_outcome(service->feed());
  } else if (command == "sleep") {
    print_outcome(service->sleep());
  } else {
    std::cout << "Unknown command '" << command << "'; try help.\n";
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  Shell shell;
  if (argc > 1) {
    const petchain::Result loaded = petchain::load_chain_config(argv[1], shell.config);
    if (!loaded.ok) {
      std::cerr << loaded.message << '\n';
      return 1;
    }
  }

  petchain::log::Level level = petchain::log::Level::Info;
  if (petchain::log::parse_level(shell.config.log_level, level)) {
    petchain::log::set_level(level);
  }

  const petchain::Result started = shell.node.start(shell.config);
  if (!started.ok) {
    std::cerr << "Init failed: " << started.message << '\n';
    return 1;
  }
  const petchain::Result authoring = shell.node.start_authoring(
      std::chrono::milliseconds(static_cast<std::int64_t>(shell.config.block_interval_ms)));
  if (!authoring.ok) {
    std::cerr << "Init failed: " << authoring.message << '\n';
    return 1;
  }

  shell.current = std::string{kDefaultAccount};
  if (session(shell, shell.current) == nullptr) {
    return 1;
  }

  std::cout << petchain::kAppDisplayName << " " << petchain::kAppVersion << " on chain " << shell.config.chain_id
            << ". Type 'help' for commands.\n";

  std::string line;
  while (true) {
    std::cout << shell.current << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    const auto words = split_words(line);
    if (words.empty()) {
      continue;
    }
    if (!handle(shell, words)) {
      break;
    }
  }

  shell.sessions.clear();
  shell.node.stop();
  return 0;
}
