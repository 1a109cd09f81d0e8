#include <atomic>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "core/config/chain_config.hpp"
#include "core/crypto/crypto.hpp"
#include "core/ledger/clock.hpp"
#include "core/model/codec.hpp"
#include "core/runtime/dispatcher.hpp"
#include "core/runtime/event_log.hpp"
#include "core/storage/key_locks.hpp"
#include "core/storage/store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace {

const petchain::AccountId kAlice{"alice"};
const petchain::AccountId kBob{"bob"};
const petchain::AccountId kCarol{"carol"};

struct Ledger {
  petchain::ManualClock clock;
  petchain::LedgerStore store;
  petchain::EventLog events;
  petchain::Dispatcher dispatcher{store, clock, events};
};

petchain::MintCall mint(std::string name, petchain::Species species, petchain::PetId id) {
  return petchain::MintCall{.name = std::move(name), .species = species, .id = id};
}

std::filesystem::path temp_file(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "petchain-tests";
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  return root / name;
}

void test_store_defaults() {
  petchain::LedgerStore store;
  assert(!store.get(kAlice).has_value());
  assert(store.feed_time_of(7) == 0);
  assert(!store.sleep_time_of(7).has_value());
  assert(store.owner_count() == 0);

  store.put(kAlice, {.id = 7, .name = "Shelly", .species = petchain::Species::Turtle});
  assert(store.contains(kAlice));
  assert(store.get(kAlice)->name == "Shelly");
  store.remove(kAlice);
  assert(!store.contains(kAlice));
}

void test_mint_and_duplicate_mint() {
  Ledger ledger;
  const std::string empty_root = ledger.store.state_root();

  const auto first = ledger.dispatcher.dispatch(kAlice, mint("Shelly", petchain::Species::Turtle, 7));
  assert(first.ok());
  assert(std::holds_alternative<petchain::PetMinted>(*first.event));
  assert(std::get<petchain::PetMinted>(*first.event).owner == kAlice);
  assert(std::get<petchain::PetMinted>(*first.event).pet_id == 7);

  const auto pet = ledger.store.get(kAlice);
  assert(pet.has_value());
  assert((*pet == petchain::PetRecord{.id = 7, .name = "Shelly", .species = petchain::Species::Turtle}));
  assert(ledger.events.size() == 1);

  const std::string root = ledger.store.state_root();
  assert(root != empty_root);
  const auto second = ledger.dispatcher.dispatch(kAlice, mint("Other", petchain::Species::Snake, 8));
  assert(!second.ok());
  assert(*second.error == petchain::DispatchError::AccountAlreadyHasPet);
  assert(!second.event.has_value());
  assert(ledger.store.get(kAlice)->id == 7);
  assert(ledger.store.state_root() == root);
  assert(ledger.events.size() == 1);
}

void test_transfer_rules() {
  Ledger ledger;
  const auto nothing = ledger.dispatcher.dispatch(kAlice, petchain::TransferCall{.receiver = kBob});
  assert(*nothing.error == petchain::DispatchError::AccountHasNoPet);

  assert(ledger.dispatcher.dispatch(kAlice, mint("Shelly", petchain::Species::Turtle, 7)).ok());
  assert(ledger.dispatcher.dispatch(kBob, mint("Hopper", petchain::Species::Rabbit, 9)).ok());
  const std::string root = ledger.store.state_root();
  const std::size_t events = ledger.events.size();

  const auto occupied = ledger.dispatcher.dispatch(kAlice, petchain::TransferCall{.receiver = kBob});
  assert(*occupied.error == petchain::DispatchError::AccountAlreadyHasPet);
  const auto to_self = ledger.dispatcher.dispatch(kAlice, petchain::TransferCall{.receiver = kAlice});
  assert(*to_self.error == petchain::DispatchError::AccountAlreadyHasPet);
  assert(ledger.store.state_root() == root);
  assert(ledger.events.size() == events);

  const auto moved = ledger.dispatcher.dispatch(kAlice, petchain::TransferCall{.receiver = kCarol});
  assert(moved.ok());
  const auto& transferred = std::get<petchain::PetTransferred>(*moved.event);
  assert(transferred.from == kAlice);
  assert(transferred.to == kCarol);
  assert(transferred.pet_id == 7);
  assert(!ledger.store.contains(kAlice));
  assert(ledger.store.get(kCarol)->name == "Shelly");
}

void test_transfer_round_trip_restores_ownership() {
  Ledger ledger;
  assert(ledger.dispatcher.dispatch(kAlice, mint("Shelly", petchain::Species::Turtle, 7)).ok());
  const std::string root = ledger.store.state_root();

  assert(ledger.dispatcher.dispatch(kAlice, petchain::TransferCall{.receiver = kBob}).ok());
  assert(ledger.dispatcher.dispatch(kBob, petchain::TransferCall{.receiver = kAlice}).ok());
  assert(ledger.store.state_root() == root);
  assert(ledger.store.owner_count() == 1);

  const auto records = ledger.events.all();
  assert(records.size() == 3);
  const auto& away = std::get<petchain::PetTransferred>(records[1].event);
  assert(away.from == kAlice && away.to == kBob && away.pet_id == 7);
  const auto& back = std::get<petchain::PetTransferred>(records[2].event);
  assert(back.from == kBob && back.to == kAlice && back.pet_id == 7);

  assert(ledger.dispatcher.dispatch(kCarol, mint("Hopper", petchain::Species::Rabbit, 9)).ok());
  const auto owners = ledger.store.owners();
  assert(owners.size() == 2);
  assert(owners.front().first == kAlice);
  assert(owners.back().first == kCarol);
}

void test_feed_and_sleep_use_clock_height() {
  Ledger ledger;
  assert(*ledger.dispatcher.dispatch(kAlice, petchain::FeedCall{}).error == petchain::DispatchError::AccountHasNoPet);
  assert(*ledger.dispatcher.dispatch(kAlice, petchain::SleepCall{}).error == petchain::DispatchError::AccountHasNoPet);
  assert(ledger.events.size() == 0);

  assert(ledger.dispatcher.dispatch(kAlice, mint("Shelly", petchain::Species::Turtle, 7)).ok());
  assert(ledger.store.feed_time_of(7) == 0);

  assert(ledger.clock.advance_to(5));
  assert(ledger.dispatcher.dispatch(kAlice, petchain::FeedCall{}).ok());
  assert(ledger.store.feed_time_of(7) == 5);

  assert(ledger.clock.advance_to(9));
  assert(ledger.dispatcher.dispatch(kAlice, petchain::FeedCall{}).ok());
  assert(ledger.store.feed_time_of(7) == 9);
  assert(!ledger.store.sleep_time_of(7).has_value());

  const auto slept = ledger.dispatcher.dispatch(kAlice, petchain::SleepCall{});
  assert(slept.ok());
  assert(std::holds_alternative<petchain::PetSlept>(*slept.event));
  assert(ledger.store.sleep_time_of(7) == 9);

  // Activity is keyed by pet id and follows the pet to its new owner.
  assert(ledger.dispatcher.dispatch(kAlice, petchain::TransferCall{.receiver = kBob}).ok());
  assert(ledger.store.feed_time_of(ledger.store.get(kBob)->id) == 9);

  const auto records = ledger.events.all();
  assert(records.back().height == 9);
  assert(records[1].height == 5);
}

void test_duplicate_pet_ids_share_activity() {
  Ledger ledger;
  assert(ledger.dispatcher.dispatch(kAlice, mint("Shelly", petchain::Species::Turtle, 7)).ok());
  assert(ledger.dispatcher.dispatch(kBob, mint("Slither", petchain::Species::Snake, 7)).ok());
  assert(ledger.store.owner_count() == 2);

  assert(ledger.clock.advance_to(3));
  assert(ledger.dispatcher.dispatch(kBob, petchain::FeedCall{}).ok());
  assert(ledger.store.feed_time_of(ledger.store.get(kAlice)->id) == 3);
}

void test_clock_never_moves_backwards() {
  petchain::ManualClock clock;
  assert(clock.now() == 0);
  assert(clock.advance_to(4));
  assert(clock.advance_to(4));
  assert(!clock.advance_to(2));
  assert(clock.now() == 4);
  assert(clock.tick() == 5);
  assert(clock.now() == 5);
}

void test_event_log_order_window_and_observers() {
  Ledger ledger;
  std::vector<std::uint64_t> observed;
  ledger.events.subscribe([&observed](const petchain::EventRecord& record) { observed.push_back(record.sequence); });

  const petchain::ExtrinsicContext context{.block = {.number = 3, .hash = "block-3"}, .index = 1, .tx_hash = "tx-1"};
  assert(ledger.dispatcher.dispatch(kAlice, mint("Shelly", petchain::Species::Turtle, 7), context).ok());
  assert(ledger.dispatcher.dispatch(kAlice, petchain::FeedCall{}).ok());
  assert(ledger.dispatcher.dispatch(kAlice, petchain::SleepCall{}).ok());
  assert(!ledger.dispatcher.dispatch(kBob, petchain::FeedCall{}).ok());

  assert((observed == std::vector<std::uint64_t>{1, 2, 3}));
  const auto all = ledger.events.all();
  assert(all.size() == 3);
  assert(petchain::event_kind(all[0].event) == petchain::EventKind::PetMinted);
  assert(petchain::event_kind(all[1].event) == petchain::EventKind::PetFed);
  assert(petchain::event_kind(all[2].event) == petchain::EventKind::PetSlept);
  assert(all[0].tx_hash == "tx-1");
  assert(all[0].extrinsic_index == 1);

  const auto window = ledger.events.recent(2);
  assert(window.size() == 2);
  assert(window.front().sequence == 2);
  assert(ledger.events.recent(10).size() == 3);
  assert(ledger.events.in_block("block-3").size() == 1);
  assert(ledger.events.in_block("missing").empty());
}

void test_check_is_read_only() {
  Ledger ledger;
  assert(ledger.dispatcher.check(kAlice, mint("Shelly", petchain::Species::Turtle, 7)) == std::nullopt);
  assert(ledger.dispatcher.check(kAlice, petchain::FeedCall{}) == petchain::DispatchError::AccountHasNoPet);
  assert(ledger.store.owner_count() == 0);
  assert(ledger.events.size() == 0);
}

void test_store_move_is_single_step() {
  petchain::LedgerStore store;
  assert(!store.move(kAlice, kBob));
  store.put(kAlice, {.id = 7, .name = "Shelly", .species = petchain::Species::Turtle});
  store.put(kCarol, {.id = 9, .name = "Hopper", .species = petchain::Species::Rabbit});
  assert(!store.move(kAlice, kCarol));
  assert(store.get(kAlice)->id == 7);
  assert(store.move(kAlice, kBob));
  assert(!store.contains(kAlice));
  assert(store.get(kBob)->name == "Shelly");
}

void test_readers_never_see_a_pet_twice_during_transfers() {
  petchain::ManualClock clock;
  petchain::LedgerStore store;
  petchain::EventLog events;
  petchain::KeyLockTable locks;
  petchain::Dispatcher dispatcher{store, clock, events, &locks};
  assert(dispatcher.dispatch(kAlice, mint("Shelly", petchain::Species::Turtle, 7)).ok());

  std::atomic<bool> done{false};
  std::atomic<std::size_t> bad_reads{0};
  std::thread reader([&] {
    while (!done.load()) {
      if (store.owner_count() != 1) {
        ++bad_reads;
      }
    }
  });

  for (int round = 0; round < 20000; ++round) {
    const bool at_alice = round % 2 == 0;
    const auto result = dispatcher.dispatch(at_alice ? kAlice : kBob,
                                            petchain::TransferCall{.receiver = at_alice ? kBob : kAlice});
    assert(result.ok());
  }
  done = true;
  reader.join();

  assert(bad_reads.load() == 0);
  assert(store.get(kAlice)->id == 7);
  assert(events.size() == 20001);
}

void test_concurrent_dispatch_with_key_locks() {
  petchain::ManualClock clock;
  petchain::LedgerStore store;
  petchain::EventLog events;
  petchain::KeyLockTable locks;
  petchain::Dispatcher dispatcher{store, clock, events, &locks};

  constexpr int kThreads = 8;
  std::atomic<int> minted{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < kThreads; ++i) {
    workers.emplace_back([&, i] {
      if (dispatcher.dispatch(kAlice, mint("pet-" + std::to_string(i), petchain::Species::Snake, 100 + i)).ok()) {
        ++minted;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  assert(minted.load() == 1);
  assert(store.owner_count() == 1);

  // Everyone tries to pull the single pet around a ring of accounts.
  const std::vector<petchain::AccountId> ring{kAlice, kBob, kCarol, petchain::AccountId{"dave"}};
  workers.clear();
  for (int i = 0; i < kThreads; ++i) {
    workers.emplace_back([&, i] {
      for (int round = 0; round < 50; ++round) {
        const auto& from = ring[(i + round) % ring.size()];
        const auto& to = ring[(i + round + 1) % ring.size()];
        (void)dispatcher.dispatch(from, petchain::TransferCall{.receiver = to});
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(store.owner_count() == 1);
  std::size_t transfers = 0;
  for (const auto& record : events.all()) {
    if (std::holds_alternative<petchain::PetTransferred>(record.event)) {
      ++transfers;
    }
  }
  assert(events.size() == transfers + 1);
  assert(locks.account_slots() >= ring.size());
}

void test_codec_bounds_names() {
  const petchain::Result fits = petchain::encode_call(mint("Shelly", petchain::Species::Turtle, 7), 6);
  assert(fits.ok);
  const petchain::Result too_long = petchain::encode_call(mint("Shellyy", petchain::Species::Turtle, 7), 6);
  assert(!too_long.ok);

  petchain::Call decoded;
  std::string reason;
  assert(petchain::decode_call(fits.data, 6, decoded, reason) == petchain::DecodeFailure::None);
  assert(std::get<petchain::MintCall>(decoded).name == "Shelly");
  assert(petchain::decode_call(fits.data, 5, decoded, reason) == petchain::DecodeFailure::NameTooLong);
  assert(petchain::decode_call("call=hatch\n", 6, decoded, reason) == petchain::DecodeFailure::Malformed);
  assert(petchain::decode_call("name=x\n", 6, decoded, reason) == petchain::DecodeFailure::Malformed);

  assert(!petchain::encode_call(petchain::TransferCall{}, 6).ok);
  assert(petchain::species_from_string("RABBIT") == petchain::Species::Rabbit);
  assert(!petchain::species_from_string("dragon").has_value());
}

void test_config_loader() {
  const auto path = temp_file("chain.conf");
  {
    std::ofstream out(path);
    out << "# dev chain\n"
        << "chain_id = petchain-test\n"
        << "name_limit=16\n"
        << "finality_depth=0\n"
        << "log_level=DEBUG\n";
  }

  petchain::ChainConfig config;
  const petchain::Result loaded = petchain::load_chain_config(path.string(), config);
  assert(loaded.ok);
  assert(config.chain_id == "petchain-test");
  assert(config.name_limit == 16);
  assert(config.finality_depth == 0);
  assert(config.log_level == "debug");
  assert(config.pool_capacity == 256);

  petchain::ChainConfig untouched;
  assert(!petchain::parse_chain_config("colour=blue\n", untouched).ok);
  assert(!petchain::parse_chain_config("name_limit=0\n", untouched).ok);
  assert(!petchain::parse_chain_config("pool_capacity=lots\n", untouched).ok);
  assert(!petchain::parse_chain_config("log_level=loud\n", untouched).ok);
  assert(!petchain::parse_chain_config("chain_id\n", untouched).ok);
  assert(untouched.chain_id == "petchain-dev");
  assert(!petchain::load_chain_config(temp_file("missing.conf").string(), untouched).ok);

  petchain::ChainConfig reparsed;
  assert(petchain::parse_chain_config(petchain::render_chain_config(config), reparsed).ok);
  assert(reparsed.chain_id == config.chain_id);
  assert(reparsed.name_limit == config.name_limit);
}

void test_crypto_signatures() {
  petchain::CryptoEngine alice;
  assert(alice.identity_from_phrase("//Alice").ok);
  petchain::CryptoEngine again;
  assert(again.identity_from_phrase("//Alice").ok);
  assert(alice.identity().account == again.identity().account);
  assert(alice.identity().account == petchain::CryptoEngine::account_for_phrase("//Alice"));
  assert(alice.identity().account != petchain::CryptoEngine::account_for_phrase("//Bob"));

  const std::string payload = "call=feed\n";
  const std::string signature = alice.sign(payload);
  assert(!signature.empty());
  assert(petchain::CryptoEngine::verify(payload, signature, alice.identity().public_key));
  assert(!petchain::CryptoEngine::verify(payload + "x", signature, alice.identity().public_key));

  petchain::CryptoEngine fresh;
  assert(fresh.generate_identity().ok);
  assert(fresh.identity().account != alice.identity().account);
  assert(!petchain::CryptoEngine::verify(payload, signature, fresh.identity().public_key));
}

void test_log_levels_and_sink() {
  petchain::log::Level parsed = petchain::log::Level::Off;
  assert(petchain::log::parse_level(" Debug ", parsed));
  assert(parsed == petchain::log::Level::Debug);
  assert(petchain::log::parse_level("trace", parsed));
  assert(parsed == petchain::log::Level::Trace);
  assert(!petchain::log::parse_level("verbose", parsed));

  std::FILE* sink = std::tmpfile();
  assert(sink != nullptr);
  petchain::log::set_sink(sink);
  petchain::log::set_level(petchain::log::Level::Info);
  petchain::log::debug("test", "hidden");
  petchain::log::warn("test", "pool nearly full");
  petchain::log::trace("test", "too fine");
  petchain::log::set_level(petchain::log::Level::Trace);
  petchain::log::trace("test", "status step");
  petchain::log::set_sink(nullptr);
  petchain::log::set_level(petchain::log::Level::Warn);

  std::rewind(sink);
  char buffer[256] = {};
  const std::size_t read = std::fread(buffer, 1, sizeof(buffer) - 1, sink);
  std::fclose(sink);
  const std::string written{buffer, read};
  assert(written.find("WARN") != std::string::npos);
  assert(written.find("test: pool nearly full") != std::string::npos);
  assert(written.find("hidden") == std::string::npos);
  assert(written.find("too fine") == std::string::npos);
  assert(written.find("TRACE test: status step") != std::string::npos);
}

}  // namespace

int main() {
  petchain::log::set_level(petchain::log::Level::Warn);
  assert(petchain::CryptoEngine::initialize_library().ok);

  test_store_defaults();
  test_mint_and_duplicate_mint();
  test_transfer_rules();
  test_transfer_round_trip_restores_ownership();
  test_feed_and_sleep_use_clock_height();
  test_duplicate_pet_ids_share_activity();
  test_clock_never_moves_backwards();
  test_event_log_order_window_and_observers();
  test_check_is_read_only();
  test_store_move_is_single_step();
  test_readers_never_see_a_pet_twice_during_transfers();
  test_concurrent_dispatch_with_key_locks();
  test_codec_bounds_names();
  test_config_loader();
  test_crypto_signatures();
  test_log_levels_and_sink();

  std::cout << "petchain_ledger_tests passed\n";
  return 0;
}
