#pragma once

#include <basalt/core/address.hpp>
#include <basalt/core/byte_string.hpp>
#include <basalt/core/bytes.hpp>
#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_map>

BASALT_EVM_NAMESPACE_BEGIN

struct Account
{
    uint256_t balance{0};
    uint64_t nonce{0};
    byte_string code{};
    // slots holding zero are not stored
    std::unordered_map<bytes32_t, bytes32_t> storage{};
};

// World state shared across runs. An interpreter borrows it for one run and
// assumes exclusive access while it executes. Reads default to zero for
// unknown accounts and unset slots; only get_account is strict.
class AccountStorage
{
    std::unordered_map<Address, Account> accounts_;

public:
    AccountStorage() = default;

    uint256_t load_slot(Address const &, uint256_t const &key) const;

    // creates the account on first write, a zero value clears the slot
    void
    store_slot(Address const &, uint256_t const &key, uint256_t const &value);

    byte_string_view code_of(Address const &) const;
    uint256_t balance_of(Address const &) const;
    uint64_t nonce_of(Address const &) const;

    bool account_exists(Address const &) const;

    // fails with UnknownAccount when the address has no record
    Result<Account const *> get_account(Address const &) const;

    void set_balance(Address const &, uint256_t const &);
    void set_code(Address const &, byte_string_view);
    void set_nonce(Address const &, uint64_t);

    size_t size() const noexcept
    {
        return accounts_.size();
    }

private:
    Account const *find(Address const &) const;
};

BASALT_EVM_NAMESPACE_END
