#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerTypeUtils.h"
#include "util/NonCopyable.h"
#include "xdr/NFT-ledger-entries.h"

#include <map>
#include <memory>
#include <optional>

/////////////////////////////////////////////////////////////////////////////
//  Overview
/////////////////////////////////////////////////////////////////////////////
//
// The ledger state is a stack of nested transactional views. The bottom of
// the stack is an InMemoryLedgerState holding every live entry and the
// current LedgerHeader. Above it sit zero or more LedgerTxn objects, each of
// which records the entries it created, modified or erased relative to its
// parent, plus its own copy of the header.
//
// A parent may have at most one open child at a time. While a child is open
// the parent is read-only from the point of view of its owner: every
// mutating or loading call on it throws. Reads that come up through the
// child (getNewestVersion, getAllEntries, getHeader) are still served.
//
// A LedgerTxn ends in exactly one of two ways:
//
//  - commit() pushes its recorded changes and header into the parent and
//    seals it.
//
//  - rollback() discards its changes (and, recursively, its open child's
//    changes) and seals it. Destroying an unsealed LedgerTxn rolls it back.
//
// Any use of a sealed LedgerTxn throws.
//
// Entries are handed out by value. A caller that wants to change an entry
// loads it, edits the copy and calls update() with the result; nothing a
// caller holds can alias state owned by a LedgerTxn.

namespace nftsim
{

typedef std::map<LedgerKey, LedgerEntry, LedgerEntryIdCmp> LedgerEntryMap;

// Changes recorded by a LedgerTxn. An empty optional marks an erased key.
typedef std::map<LedgerKey, std::optional<LedgerEntry>, LedgerEntryIdCmp>
    LedgerEntryChanges;

class AbstractLedgerTxn;

// Interface of anything a LedgerTxn can be opened on.
class AbstractLedgerTxnParent
{
  public:
    virtual ~AbstractLedgerTxnParent();

    // Registers `child` as the single open child. Throws if a child is
    // already open.
    virtual void addChild(AbstractLedgerTxn& child) = 0;

    // Merges the child's changes and header into this parent and forgets the
    // child.
    virtual void commitChild(LedgerEntryChanges const& changes,
                             LedgerHeader const& header) = 0;

    // Forgets the child without applying anything.
    virtual void rollbackChild() = 0;

    // Returns the newest version of `key` visible from this parent, or
    // nullptr if it does not exist (or was erased).
    virtual std::shared_ptr<LedgerEntry const>
    getNewestVersion(LedgerKey const& key) const = 0;

    // Returns every live entry of the given type visible from this parent,
    // ordered by key.
    virtual LedgerEntryMap getAllEntries(LedgerEntryType type) const = 0;

    virtual LedgerHeader const& getHeader() const = 0;
};

// Mutable view of the ledger that operations and transactions apply into.
class AbstractLedgerTxn : public AbstractLedgerTxnParent
{
  public:
    virtual ~AbstractLedgerTxn();

    virtual void commit() = 0;
    virtual void rollback() = 0;

    // Returns a copy of the entry for `key`, or nothing if it does not exist.
    virtual std::optional<LedgerEntry> load(LedgerKey const& key) = 0;

    virtual bool exists(LedgerKey const& key) = 0;

    // Throws if an entry with the same key already exists.
    virtual void create(LedgerEntry const& entry) = 0;

    // Replaces an existing entry. Throws if the entry does not exist.
    virtual void update(LedgerEntry const& entry) = 0;

    // Throws if the entry does not exist.
    virtual void erase(LedgerKey const& key) = 0;

    // The header of the ledger being built; changes to it are committed with
    // the rest of this LedgerTxn.
    virtual LedgerHeader& loadHeader() = 0;
};

class LedgerTxn final : public AbstractLedgerTxn
{
    class Impl;
    std::unique_ptr<Impl> mImpl;

    Impl& getImpl();
    Impl const& getImpl() const;

  public:
    explicit LedgerTxn(AbstractLedgerTxnParent& parent);
    LedgerTxn(LedgerTxn const&) = delete;
    LedgerTxn& operator=(LedgerTxn const&) = delete;

    virtual ~LedgerTxn();

    void addChild(AbstractLedgerTxn& child) override;

    void commit() override;

    void commitChild(LedgerEntryChanges const& changes,
                     LedgerHeader const& header) override;

    void create(LedgerEntry const& entry) override;

    void erase(LedgerKey const& key) override;

    bool exists(LedgerKey const& key) override;

    LedgerEntryMap getAllEntries(LedgerEntryType type) const override;

    LedgerHeader const& getHeader() const override;

    std::shared_ptr<LedgerEntry const>
    getNewestVersion(LedgerKey const& key) const override;

    std::optional<LedgerEntry> load(LedgerKey const& key) override;

    LedgerHeader& loadHeader() override;

    void rollback() override;

    void rollbackChild() override;

    void update(LedgerEntry const& entry) override;

    // Number of keys this LedgerTxn has touched (created, updated or erased).
    size_t countChanges() const;
};

// The committed ledger state at the bottom of the stack.
class InMemoryLedgerState : public AbstractLedgerTxnParent,
                            public NonMovableOrCopyable
{
    LedgerEntryMap mEntries;
    LedgerHeader mHeader;
    AbstractLedgerTxn* mChild{nullptr};

  public:
    explicit InMemoryLedgerState(LedgerHeader const& header);

    void addChild(AbstractLedgerTxn& child) override;

    void commitChild(LedgerEntryChanges const& changes,
                     LedgerHeader const& header) override;

    void rollbackChild() override;

    std::shared_ptr<LedgerEntry const>
    getNewestVersion(LedgerKey const& key) const override;

    LedgerEntryMap getAllEntries(LedgerEntryType type) const override;

    LedgerHeader const& getHeader() const override;

    size_t countObjects(LedgerEntryType type) const;

    bool hasChild() const;
};
}
