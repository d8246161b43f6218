// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <sigmgr/core/common/base.hpp>
#include <sigmgr/core/common/util.hpp>
#include <sigmgr/core/program/instruction_builder.hpp>
#include <sigmgr/infra/cli/common.hpp>
#include <sigmgr/infra/cli/hex_option.hpp>
#include <sigmgr/infra/common/log.hpp>
#include <sigmgr/infra/crypto/ethereum_signer.hpp>

using namespace sigmgr;
using namespace sigmgr::cmd::common;

//! Values parsed from the command line, converted after CLI::App::parse
struct Arguments {
    std::optional<std::filesystem::path> config_file;
    std::string program_id;
    std::string signer_group;
    std::string valid_signer;
    std::string owner;
    std::string eth_address;
    std::string signature;
    unsigned int recovery_id{0};
    std::string message;
    std::string private_key;
};

static Identity parse_identity(const std::string& hex) {
    const std::optional<Identity> identity{hex_to_identity(hex)};
    if (!identity) {
        throw std::invalid_argument("invalid identity: " + hex);
    }
    return *identity;
}

static evmc::address parse_address(const std::string& hex) {
    const std::optional<evmc::address> address{hex_to_address(hex)};
    if (!address) {
        throw std::invalid_argument("invalid address: " + hex);
    }
    return *address;
}

static ProgramConfig resolve_config(const Arguments& args) {
    ProgramConfig config;
    if (args.config_file) {
        config = read_program_config(*args.config_file);
    } else if (args.program_id.empty()) {
        throw std::invalid_argument("either --config or --program-id is required");
    }
    if (!args.program_id.empty()) {
        config.program_id = parse_identity(args.program_id);
    }
    return config;
}

static nlohmann::json to_json(const Instruction& instruction) {
    nlohmann::json accounts = nlohmann::json::array();
    for (const AccountMeta& meta : instruction.accounts) {
        accounts.push_back({
            {"pubkey", identity_to_hex(meta.key)},
            {"isSigner", meta.is_signer},
            {"isWritable", meta.is_writable},
        });
    }
    nlohmann::json json;
    json["programId"] = identity_to_hex(instruction.program_id);
    json["accounts"] = accounts;
    json["data"] = to_hex(instruction.data, /*with_prefix=*/true);
    return json;
}

static void print_batch(const std::vector<Instruction>& batch) {
    nlohmann::json instructions = nlohmann::json::array();
    for (const Instruction& instruction : batch) {
        instructions.push_back(to_json(instruction));
    }
    std::cout << nlohmann::json{{"instructions", instructions}}.dump(2) << "\n";
}

static SignatureData signature_data(const Arguments& args) {
    const std::optional<Bytes> raw{from_hex(args.signature)};
    if (!raw || raw->size() != kSignatureLength) {
        throw std::invalid_argument("invalid signature: " + args.signature);
    }
    SignatureData data{.recovery_id = static_cast<uint8_t>(args.recovery_id),
                       .message = Bytes{args.message.begin(), args.message.end()}};
    std::copy(raw->begin(), raw->end(), data.signature.begin());
    return data;
}

static void add_recovery_options(CLI::App& cmd, Arguments& args) {
    cmd.add_option("--signature", args.signature, "Compact secp256k1 signature (r || s) as hex")
        ->required()
        ->check(HexBytesValidator{kSignatureLength});
    cmd.add_option("--recovery-id", args.recovery_id, "Recovery id of the signature")
        ->check(CLI::Range(0u, 3u))
        ->capture_default_str();
}

int main(int argc, char* argv[]) {
    CLI::App app{"Builds signer group program instructions and prints them as JSON"};
    app.require_subcommand(1);

    Arguments args;
    log::Settings log_settings;
    add_logging_options(app, log_settings);
    add_option_config_file(app, args.config_file);
    add_option_program_id(app, args.program_id);

    auto* init_group_cmd = app.add_subcommand("init-signer-group", "Initializes a signer group with its owner");
    add_option_identity(*init_group_cmd, "--signer-group", args.signer_group, "Signer group account");
    add_option_identity(*init_group_cmd, "--owner", args.owner, "Owner of the signer group");

    auto* init_signer_cmd = app.add_subcommand("init-valid-signer", "Registers an Ethereum address under a signer group");
    add_option_identity(*init_signer_cmd, "--valid-signer", args.valid_signer, "Valid signer account");
    add_option_identity(*init_signer_cmd, "--signer-group", args.signer_group, "Signer group account");
    add_option_identity(*init_signer_cmd, "--owner", args.owner, "Owner of the signer group");
    init_signer_cmd->add_option("--eth-address", args.eth_address, "Ethereum address of the signer")
        ->required()
        ->check(HexBytesValidator{kAddressLength});

    auto* clear_signer_cmd = app.add_subcommand("clear-valid-signer", "Revokes a valid signer");
    add_option_identity(*clear_signer_cmd, "--valid-signer", args.valid_signer, "Valid signer account");
    add_option_identity(*clear_signer_cmd, "--signer-group", args.signer_group, "Signer group account");
    add_option_identity(*clear_signer_cmd, "--owner", args.owner, "Owner of the signer group");

    auto* validate_cmd = app.add_subcommand("validate-signature", "Validates a signature by a valid signer");
    add_option_identity(*validate_cmd, "--valid-signer", args.valid_signer, "Valid signer account");
    add_option_identity(*validate_cmd, "--signer-group", args.signer_group, "Signer group account");
    add_recovery_options(*validate_cmd, args);
    validate_cmd->add_option("--message", args.message, "Signed message")->required();
    validate_cmd->add_option("--eth-address", args.eth_address,
                             "Ethereum address of the signer: emits the secp256k1 instruction first")
        ->check(HexBytesValidator{kAddressLength});

    auto* sign_cmd = app.add_subcommand("sign", "Signs a message with an Ethereum private key");
    sign_cmd->add_option("--private-key", args.private_key, "secp256k1 private key as hex")
        ->required()
        ->check(HexBytesValidator{kHashLength});
    sign_cmd->add_option("--message", args.message, "Message to sign")->required();

    CLI11_PARSE(app, argc, argv)

    try {
        log::init(log_settings);

        if (*sign_cmd) {
            EthereumSigner signer{*from_hex(args.private_key)};
            const SignatureData data{signer.sign(Bytes{args.message.begin(), args.message.end()})};
            const nlohmann::json json{
                {"ethAddress", address_to_hex(signer.address())},
                {"signature", to_hex(data.signature, /*with_prefix=*/true)},
                {"recoveryId", data.recovery_id},
            };
            std::cout << json.dump(2) << "\n";
            return 0;
        }

        const ProgramConfig config{resolve_config(args)};
        SIGMGR_INFO_M("Program", {"id", identity_to_hex(config.program_id)});

        std::vector<Instruction> batch;
        if (*init_group_cmd) {
            batch.push_back(make_init_signer_group(config, parse_identity(args.signer_group), parse_identity(args.owner)));
        } else if (*init_signer_cmd) {
            batch.push_back(make_init_valid_signer(config, parse_identity(args.valid_signer),
                                                   parse_identity(args.signer_group), parse_identity(args.owner),
                                                   parse_address(args.eth_address)));
        } else if (*clear_signer_cmd) {
            batch.push_back(make_clear_valid_signer(config, parse_identity(args.valid_signer),
                                                    parse_identity(args.signer_group), parse_identity(args.owner)));
        } else if (*validate_cmd) {
            const SignatureData data{signature_data(args)};
            if (!args.eth_address.empty()) {
                std::optional<Instruction> secp{make_secp256k1_instruction(config, parse_address(args.eth_address), data,
                                                                           /*instruction_index=*/0)};
                if (!secp) {
                    throw std::invalid_argument("message too long for the secp256k1 instruction");
                }
                batch.push_back(std::move(*secp));
            }
            batch.push_back(make_validate_signature(config, parse_identity(args.valid_signer),
                                                    parse_identity(args.signer_group), data));
        }

        SIGMGR_INFO_M("Instructions built", {"count", std::to_string(batch.size())});
        print_batch(batch);
    } catch (const std::exception& ex) {
        SIGMGR_ERROR_M("Command failed", {"error", ex.what()});
        return -1;
    }

    return 0;
}
