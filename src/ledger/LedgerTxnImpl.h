#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerTxn.h"

namespace nftsim
{

class LedgerTxn::Impl
{
    AbstractLedgerTxnParent& mParent;
    AbstractLedgerTxn* mChild;
    LedgerHeader mHeader;
    LedgerEntryChanges mEntries;
    bool mIsSealed;

    void throwIfChild() const;
    void throwIfSealed() const;

  public:
    Impl(LedgerTxn& self, AbstractLedgerTxnParent& parent);

    // addChild has the strong exception safety guarantee
    void addChild(AbstractLedgerTxn& child);

    // commit has the strong exception safety guarantee
    void commit();

    // commitChild has the strong exception safety guarantee
    void commitChild(LedgerEntryChanges const& changes,
                     LedgerHeader const& header);

    // create, erase and update have the strong exception safety guarantee
    void create(LedgerEntry const& entry);
    void erase(LedgerKey const& key);
    void update(LedgerEntry const& entry);

    bool exists(LedgerKey const& key) const;

    LedgerEntryMap getAllEntries(LedgerEntryType type) const;

    LedgerHeader const& getHeader() const;

    std::shared_ptr<LedgerEntry const>
    getNewestVersion(LedgerKey const& key) const;

    std::optional<LedgerEntry> load(LedgerKey const& key) const;

    LedgerHeader& loadHeader();

    // rollback does not throw
    void rollback() noexcept;

    // rollbackChild does not throw
    void rollbackChild() noexcept;

    size_t countChanges() const;

    bool isSealed() const;
};
}
