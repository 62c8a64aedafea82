#include <basalt/core/address.hpp>
#include <basalt/core/bytes.hpp>
#include <basalt/evm/account_storage.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/error.hpp>

#include <intx/intx.hpp>

BASALT_EVM_NAMESPACE_BEGIN

Account const *AccountStorage::find(Address const &address) const
{
    auto const it = accounts_.find(address);
    return it == accounts_.end() ? nullptr : &it->second;
}

uint256_t
AccountStorage::load_slot(Address const &address, uint256_t const &key) const
{
    auto const *const account = find(address);
    if (account == nullptr) {
        return 0;
    }
    auto const it = account->storage.find(to_bytes(key));
    if (it == account->storage.end()) {
        return 0;
    }
    return intx::be::load<uint256_t>(it->second);
}

void AccountStorage::store_slot(
    Address const &address, uint256_t const &key, uint256_t const &value)
{
    auto &storage = accounts_[address].storage;
    if (value == 0) {
        storage.erase(to_bytes(key));
    }
    else {
        storage.insert_or_assign(to_bytes(key), to_bytes(value));
    }
}

byte_string_view AccountStorage::code_of(Address const &address) const
{
    auto const *const account = find(address);
    return account == nullptr ? byte_string_view{}
                              : byte_string_view{account->code};
}

uint256_t AccountStorage::balance_of(Address const &address) const
{
    auto const *const account = find(address);
    return account == nullptr ? uint256_t{0} : account->balance;
}

uint64_t AccountStorage::nonce_of(Address const &address) const
{
    auto const *const account = find(address);
    return account == nullptr ? 0 : account->nonce;
}

bool AccountStorage::account_exists(Address const &address) const
{
    return accounts_.contains(address);
}

Result<Account const *>
AccountStorage::get_account(Address const &address) const
{
    auto const *const account = find(address);
    if (account == nullptr) {
        return Error::UnknownAccount;
    }
    return account;
}

void AccountStorage::set_balance(
    Address const &address, uint256_t const &balance)
{
    accounts_[address].balance = balance;
}

void AccountStorage::set_code(
    Address const &address, byte_string_view const code)
{
    accounts_[address].code = byte_string{code};
}

void AccountStorage::set_nonce(Address const &address, uint64_t const nonce)
{
    accounts_[address].nonce = nonce;
}

BASALT_EVM_NAMESPACE_END
