#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <keystone/crypto/pda.hpp>
#include <keystone/execution/processor.hpp>
#include <keystone/runtime/bank.hpp>
#include <keystone/schema/encoding/fixed/encoder.hpp>
#include <keystone/schema/ids.hpp>
#include <keystone/schema/instruction.hpp>
#include <keystone/storage/rocksdb/storage.hpp>

#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace keystone::schema;

namespace {

constexpr auto kExitProgramError = 1;
constexpr auto kExitUsageError = 2;

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "keystone", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::optional<pubkey_t> derive_state_address(const pubkey_t& payer,
                                             std::optional<uint8_t> bump) {
  if (!bump) {
    auto seeds = std::array{make_bytes_view(kStateSeed), make_bytes_view(payer)};
    auto found = keystone::crypto::find_program_address(seeds, kProgramId);
    if (!found) {
      return std::nullopt;
    }
    return found->first;
  }
  auto bump_seed = std::array{*bump};
  auto seeds = std::array{make_bytes_view(kStateSeed), make_bytes_view(payer),
                          bytes_view_t{bump_seed.data(), bump_seed.size()}};
  return keystone::crypto::create_program_address(seeds, kProgramId);
}

keystone::runtime::instruction_t make_initialize(const pubkey_t& payer,
                                                 const pubkey_t& state,
                                                 std::optional<uint8_t> bump) {
  auto instruction = keystone::runtime::instruction_t{};
  instruction.program_id = kProgramId;
  instruction.accounts = {
      {.key = payer, .is_signer = true, .is_writable = true},
      {.key = state, .is_signer = false, .is_writable = true},
      {.key = kRentSysvarId, .is_signer = false, .is_writable = false},
      {.key = kSystemProgramId, .is_signer = false, .is_writable = false}};
  instruction.data = {
      static_cast<uint8_t>(instruction_discriminant_t::initialize)};
  if (bump) {
    instruction.data.push_back(*bump);
  }
  return instruction;
}

keystone::runtime::instruction_t make_update(const pubkey_t& payer,
                                             const pubkey_t& state) {
  auto instruction = keystone::runtime::instruction_t{};
  instruction.program_id = kProgramId;
  instruction.accounts = {
      {.key = payer, .is_signer = true, .is_writable = true},
      {.key = state, .is_signer = false, .is_writable = true}};
  instruction.data = {static_cast<uint8_t>(instruction_discriminant_t::update)};
  return instruction;
}

void print_state(const pubkey_t& state,
                 const std::optional<account_t>& account) {
  std::cout << "state account: " << to_base58(state) << std::endl;
  if (!account) {
    std::cout << "  (not created)" << std::endl;
    return;
  }
  std::cout << "  lamports: " << account->lamports << std::endl;
  std::cout << "  owner program: " << to_base58(account->owner) << std::endl;

  auto encoder = keystone::schema::encoding::encoder<
      keystone::schema::encoding::fixed_layout_encoder_tag>{};
  auto record = encoder.try_decode<state_record_t>(
      bytes_view_t{account->data.data(), account->data.size()});
  if (!record) {
    std::cout << "  record: (corrupt, " << account->data.size() << " bytes)"
              << std::endl;
    return;
  }
  std::cout << "  is_initialized: " << std::boolalpha << record->is_initialized
            << std::endl;
  std::cout << "  owner: " << to_base58(record->owner) << std::endl;
  std::cout << "  lifecycle_state: " << to_string(record->lifecycle_state)
            << std::endl;
  std::cout << "  payload: " << to_hex(make_bytes_view(record->payload))
            << std::endl;
  std::cout << "  update_count: " << record->update_count << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto ledger_path = std::string{};
  auto payer_text = std::string{};
  auto log_file = std::string{};
  auto airdrop = uint64_t{};
  auto bump_value = unsigned{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Keystone"};
  description.add_options()("help,h", "Show the help message")(
      "ledger,l",
      boost::program_options::value<std::string>(&ledger_path)
          ->default_value("keystone-ledger"),
      "Directory of the local account ledger")(
      "payer,p", boost::program_options::value<std::string>(&payer_text),
      "Base58 public key of the signing payer")(
      "airdrop", boost::program_options::value<uint64_t>(&airdrop),
      "Credit the payer with this many lamports first")(
      "initialize", "Run the Initialize instruction")(
      "update", "Run the Update instruction")(
      "bump", boost::program_options::value<unsigned>(&bump_value),
      "Explicit bump seed for Initialize (default: canonical)")(
      "show", "Print the payer's state record")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)
          ->default_value("keystone.log"),
      "File that receives a copy of the log")("verbose,v",
                                              "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return kExitUsageError;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  configure_logging(log_file, vm.contains("verbose"));

  if (vm.contains("initialize") && vm.contains("update")) {
    spdlog::error("--initialize and --update are mutually exclusive");
    spdlog::shutdown();
    return kExitUsageError;
  }
  auto payer = try_make_pubkey(std::string_view{payer_text});
  if (!payer) {
    spdlog::error("--payer must be a base58 encoded 32-byte public key");
    spdlog::shutdown();
    return kExitUsageError;
  }
  auto bump = std::optional<uint8_t>{};
  if (vm.contains("bump")) {
    if (bump_value > 255) {
      spdlog::error("--bump must be between 0 and 255");
      spdlog::shutdown();
      return kExitUsageError;
    }
    bump = static_cast<uint8_t>(bump_value);
  }

  auto state = derive_state_address(*payer, bump);
  if (!state) {
    spdlog::error("Bump {} does not derive an off-curve state address",
                  bump_value);
    spdlog::shutdown();
    return kExitProgramError;
  }

  auto storage =
      keystone::storage::make_storage<keystone::storage::rocksdb_storage_tag>(
          ledger_path);
  auto bank = keystone::runtime::bank{};
  for (auto& [key, account] : storage.list_accounts()) {
    bank.set_account(key, std::move(account));
  }
  if (!bank.get_account(kRentSysvarId)) {
    bank.install_rent_sysvar();
  }
  bank.register_program(kProgramId, keystone::execution::process_instruction);

  // The airdrop and the instruction land together or not at all.
  auto checkpoint = bank.checkpoint();
  if (airdrop > 0) {
    bank.airdrop(*payer, airdrop);
  }

  auto exit_code = 0;
  auto instructions = std::vector<keystone::runtime::instruction_t>{};
  if (vm.contains("initialize")) {
    instructions.push_back(make_initialize(*payer, *state, bump));
  } else if (vm.contains("update")) {
    instructions.push_back(make_update(*payer, *state));
  }
  if (!instructions.empty()) {
    auto result = bank.process_transaction(instructions);
    if (!result.ok()) {
      spdlog::error("Transaction failed with {} (code {}): {}",
                    to_string(*result.error),
                    static_cast<uint32_t>(*result.error), result.log);
      bank.rollback(std::move(checkpoint));
      exit_code = kExitProgramError;
    }
  }

  auto entries = std::vector<keystone::storage::account_entry_t>(
      std::begin(bank.accounts()), std::end(bank.accounts()));
  storage.save_accounts(entries);

  if (vm.contains("show")) {
    print_state(*state, bank.get_account(*state));
  }

  spdlog::shutdown();
  return exit_code;
}
