#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/NFT-ledger-entries.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nftsim
{

class AbstractLedgerTxn;
class AbstractLedgerTxnParent;

std::optional<LedgerEntry> loadAccount(AbstractLedgerTxn& ltx,
                                       AccountID const& accountID);

std::shared_ptr<LedgerEntry const>
loadAccountWithoutRecord(AbstractLedgerTxnParent const& ledger,
                         AccountID const& accountID);

std::optional<LedgerEntry> loadNFT(AbstractLedgerTxn& ltx,
                                   std::string const& denom,
                                   std::string const& id);

std::shared_ptr<LedgerEntry const>
loadNFTWithoutRecord(AbstractLedgerTxnParent const& ledger,
                     std::string const& denom, std::string const& id);

// Creates an account with the next account number from the header and
// sequence number 0. Throws if the account exists or the balances are not
// valid coins.
LedgerEntry createAccount(AbstractLedgerTxn& ltx, AccountID const& accountID,
                          std::vector<Coin> const& balances,
                          VestingSchedule const* vesting);

LedgerEntry createNFT(AbstractLedgerTxn& ltx, std::string const& denom,
                      std::string const& id, AccountID const& owner,
                      std::string const& tokenURI);

int64_t getBalance(std::vector<Coin> const& coins, std::string const& denom);

// Balances minus whatever the vesting schedule still locks at `now`, clamped
// at zero per coin. Order follows `account.balances`.
std::vector<Coin> getSpendableBalances(AccountEntry const& account,
                                       TimePoint now);

int64_t getSpendableBalance(AccountEntry const& account,
                            std::string const& denom, TimePoint now);

// Adds `delta` of `denom` to `coins`, keeping them sorted by denom and
// dropping coins that reach zero. Returns false, leaving `coins` unchanged,
// if the result would be negative, overflow, or need more than
// MAX_COINS_PER_ACCOUNT entries.
bool addBalance(std::vector<Coin>& coins, std::string const& denom,
                int64_t delta);

bool isCoinValid(Coin const& coin);

// Denom and id strings of NFTs: printable and not blank.
bool isNFTStringValid(std::string const& str);

std::string coinsToString(std::vector<Coin> const& coins);
}
