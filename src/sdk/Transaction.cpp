#include "veilrelay/sdk/Transaction.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include <algorithm>

namespace veilrelay {
namespace sdk {

namespace {

constexpr uint8_t VERSIONED_MESSAGE_PREFIX = 0x80;
constexpr uint32_t SYSTEM_TRANSFER_INDEX = 2;

struct KeyEntry {
    PublicKey key;
    bool is_signer;
    bool is_writable;
};

int key_rank(const KeyEntry& entry) {
    if (entry.is_signer) {
        return entry.is_writable ? 0 : 1;
    }
    return entry.is_writable ? 2 : 3;
}

} // namespace

Result<ByteVector> Transaction::compile_message(const PublicKey& fee_payer,
                                                const std::vector<Instruction>& instructions,
                                                const std::string& recent_blockhash) {
    auto blockhash = Encoding::base58_decode(recent_blockhash);
    if (blockhash.is_err() || blockhash.value().size() != constants::HASH_SIZE) {
        return {ErrorCode::INVALID_PARAMETER, "Invalid recent blockhash"};
    }
    if (instructions.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "Transaction has no instructions"};
    }

    std::vector<KeyEntry> keys;
    keys.push_back({fee_payer, true, true});

    auto add_key = [&keys](const PublicKey& key, bool signer, bool writable) {
        for (auto& entry : keys) {
            if (entry.key == key) {
                entry.is_signer = entry.is_signer || signer;
                entry.is_writable = entry.is_writable || writable;
                return;
            }
        }
        keys.push_back({key, signer, writable});
    };

    for (const auto& ix : instructions) {
        for (const auto& meta : ix.accounts) {
            add_key(meta.pubkey, meta.is_signer, meta.is_writable);
        }
        add_key(ix.program_id, false, false);
    }

    // Fee payer stays at index 0 because it ranks first and the sort is stable
    std::stable_sort(keys.begin(), keys.end(), [](const KeyEntry& a, const KeyEntry& b) {
        return key_rank(a) < key_rank(b);
    });

    if (keys.size() > 256) {
        return {ErrorCode::INVALID_PARAMETER, "Too many accounts in transaction"};
    }

    uint8_t num_signers = 0;
    uint8_t num_readonly_signed = 0;
    uint8_t num_readonly_unsigned = 0;
    for (const auto& entry : keys) {
        if (entry.is_signer) {
            ++num_signers;
            if (!entry.is_writable) ++num_readonly_signed;
        } else if (!entry.is_writable) {
            ++num_readonly_unsigned;
        }
    }

    auto index_of = [&keys](const PublicKey& key) -> uint8_t {
        for (size_t i = 0; i < keys.size(); ++i) {
            if (keys[i].key == key) {
                return static_cast<uint8_t>(i);
            }
        }
        return 0;
    };

    ByteVector message;
    message.push_back(num_signers);
    message.push_back(num_readonly_signed);
    message.push_back(num_readonly_unsigned);

    Encoding::append_compact_u16(message, static_cast<uint16_t>(keys.size()));
    for (const auto& entry : keys) {
        message.insert(message.end(), entry.key.bytes().begin(), entry.key.bytes().end());
    }

    message.insert(message.end(), blockhash.value().begin(), blockhash.value().end());

    Encoding::append_compact_u16(message, static_cast<uint16_t>(instructions.size()));
    for (const auto& ix : instructions) {
        message.push_back(index_of(ix.program_id));

        Encoding::append_compact_u16(message, static_cast<uint16_t>(ix.accounts.size()));
        for (const auto& meta : ix.accounts) {
            message.push_back(index_of(meta.pubkey));
        }

        Encoding::append_compact_u16(message, static_cast<uint16_t>(ix.data.size()));
        message.insert(message.end(), ix.data.begin(), ix.data.end());
    }

    return message;
}

Result<ByteVector> Transaction::build_signed(const Keypair& payer,
                                             const std::vector<Instruction>& instructions,
                                             const std::string& recent_blockhash) {
    auto message = compile_message(payer.public_key(), instructions, recent_blockhash);
    if (message.is_err()) {
        return {message.error(), message.error_message()};
    }

    // Only the payer signs what the relay builds
    if (message.value()[0] != 1) {
        return {ErrorCode::INVALID_PARAMETER, "Transaction requires signers other than the payer"};
    }

    auto signature = payer.sign(message.value());
    if (signature.is_err()) {
        return {signature.error(), signature.error_message()};
    }

    ByteVector transaction;
    Encoding::append_compact_u16(transaction, 1);
    transaction.insert(transaction.end(), signature.value().begin(), signature.value().end());
    transaction.insert(transaction.end(), message.value().begin(), message.value().end());
    return transaction;
}

Result<ByteVector> Transaction::sign_serialized(const ByteVector& transaction, const Keypair& signer) {
    size_t offset = 0;
    auto signature_count = Encoding::read_compact_u16(transaction, offset);
    if (signature_count.is_err()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Malformed transaction signature section"};
    }

    const size_t signatures_offset = offset;
    const size_t message_offset = signatures_offset + signature_count.value() * constants::SIGNATURE_SIZE;
    if (message_offset >= transaction.size()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Transaction truncated before message"};
    }

    ByteVector message(transaction.begin() + message_offset, transaction.end());

    size_t cursor = 0;
    if (message[0] & VERSIONED_MESSAGE_PREFIX) {
        cursor = 1;
    }
    if (cursor + 3 > message.size()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Transaction message header truncated"};
    }

    const uint8_t num_required = message[cursor];
    cursor += 3;

    auto key_count = Encoding::read_compact_u16(message, cursor);
    if (key_count.is_err() || cursor + key_count.value() * constants::PUBLIC_KEY_SIZE > message.size()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Transaction account keys truncated"};
    }

    const size_t signer_slots = std::min<size_t>(num_required, signature_count.value());
    size_t slot = signer_slots;
    const auto& target = signer.public_key().bytes();
    for (size_t i = 0; i < signer_slots && i < key_count.value(); ++i) {
        if (std::equal(target.begin(), target.end(), message.begin() + cursor + i * constants::PUBLIC_KEY_SIZE)) {
            slot = i;
            break;
        }
    }

    if (slot == signer_slots) {
        return {ErrorCode::SIGNATURE_FAILED, "Signer is not a required signer of this transaction"};
    }

    auto signature = signer.sign(message);
    if (signature.is_err()) {
        return {signature.error(), signature.error_message()};
    }

    ByteVector signed_transaction = transaction;
    std::copy(signature.value().begin(), signature.value().end(),
              signed_transaction.begin() + signatures_offset + slot * constants::SIGNATURE_SIZE);
    return signed_transaction;
}

Result<std::string> Transaction::first_signature(const ByteVector& transaction) {
    size_t offset = 0;
    auto signature_count = Encoding::read_compact_u16(transaction, offset);
    if (signature_count.is_err() || signature_count.value() == 0 ||
        offset + constants::SIGNATURE_SIZE > transaction.size()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Transaction has no signature"};
    }

    ByteVector signature(transaction.begin() + offset,
                         transaction.begin() + offset + constants::SIGNATURE_SIZE);
    return Encoding::base58_encode(signature);
}

Instruction Transaction::system_transfer(const PublicKey& from, const PublicKey& to, uint64_t lamports) {
    static const PublicKey system_program = PublicKey::from_base58(constants::SYSTEM_PROGRAM_ID).value();

    Instruction ix;
    ix.program_id = system_program;
    ix.accounts = {
        AccountMeta::writable(from, true),
        AccountMeta::writable(to)
    };
    Encoding::append_u32_le(ix.data, SYSTEM_TRANSFER_INDEX);
    Encoding::append_u64_le(ix.data, lamports);
    return ix;
}

} // namespace sdk
} // namespace veilrelay
