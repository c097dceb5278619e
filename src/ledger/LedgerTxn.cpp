// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerTxn.h"
#include "ledger/LedgerTxnImpl.h"
#include "util/GlobalChecks.h"

#include <stdexcept>

namespace nftsim
{

// Implementation of AbstractLedgerTxnParent --------------------------------
AbstractLedgerTxnParent::~AbstractLedgerTxnParent()
{
}

// Implementation of AbstractLedgerTxn --------------------------------------
AbstractLedgerTxn::~AbstractLedgerTxn()
{
}

// Implementation of LedgerTxn ----------------------------------------------
LedgerTxn::LedgerTxn(AbstractLedgerTxnParent& parent)
    : mImpl(std::make_unique<Impl>(*this, parent))
{
}

LedgerTxn::Impl::Impl(LedgerTxn& self, AbstractLedgerTxnParent& parent)
    : mParent(parent)
    , mChild(nullptr)
    , mHeader(parent.getHeader())
    , mIsSealed(false)
{
    mParent.addChild(self);
}

LedgerTxn::~LedgerTxn()
{
    if (mImpl && !mImpl->isSealed())
    {
        rollback();
    }
}

LedgerTxn::Impl&
LedgerTxn::getImpl()
{
    if (!mImpl)
    {
        throw std::runtime_error("LedgerTxn has no implementation");
    }
    return *mImpl;
}

LedgerTxn::Impl const&
LedgerTxn::getImpl() const
{
    if (!mImpl)
    {
        throw std::runtime_error("LedgerTxn has no implementation");
    }
    return *mImpl;
}

void
LedgerTxn::addChild(AbstractLedgerTxn& child)
{
    getImpl().addChild(child);
}

void
LedgerTxn::Impl::addChild(AbstractLedgerTxn& child)
{
    throwIfSealed();
    throwIfChild();
    mChild = &child;
}

void
LedgerTxn::Impl::throwIfChild() const
{
    if (mChild)
    {
        throw std::runtime_error("LedgerTxn has child");
    }
}

void
LedgerTxn::Impl::throwIfSealed() const
{
    if (mIsSealed)
    {
        throw std::runtime_error("LedgerTxn is sealed");
    }
}

void
LedgerTxn::commit()
{
    getImpl().commit();
}

void
LedgerTxn::Impl::commit()
{
    throwIfSealed();
    throwIfChild();

    mParent.commitChild(mEntries, mHeader);
    mEntries.clear();
    mIsSealed = true;
}

void
LedgerTxn::commitChild(LedgerEntryChanges const& changes,
                       LedgerHeader const& header)
{
    getImpl().commitChild(changes, header);
}

void
LedgerTxn::Impl::commitChild(LedgerEntryChanges const& changes,
                             LedgerHeader const& header)
{
    throwIfSealed();
    releaseAssert(mChild);

    // Build the merged state aside so a failure leaves this LedgerTxn as it
    // was.
    auto merged = mEntries;
    for (auto const& kv : changes)
    {
        merged[kv.first] = kv.second;
    }

    mEntries.swap(merged);
    mHeader = header;
    mChild = nullptr;
}

void
LedgerTxn::create(LedgerEntry const& entry)
{
    getImpl().create(entry);
}

void
LedgerTxn::Impl::create(LedgerEntry const& entry)
{
    throwIfSealed();
    throwIfChild();

    auto key = LedgerEntryKey(entry);
    if (getNewestVersion(key))
    {
        throw std::runtime_error("Key already exists");
    }

    auto current = entry;
    current.lastModifiedLedgerSeq = mHeader.ledgerSeq;
    mEntries[key] = current;
}

void
LedgerTxn::erase(LedgerKey const& key)
{
    getImpl().erase(key);
}

void
LedgerTxn::Impl::erase(LedgerKey const& key)
{
    throwIfSealed();
    throwIfChild();

    if (!getNewestVersion(key))
    {
        throw std::runtime_error("Key does not exist");
    }
    mEntries[key] = std::nullopt;
}

void
LedgerTxn::update(LedgerEntry const& entry)
{
    getImpl().update(entry);
}

void
LedgerTxn::Impl::update(LedgerEntry const& entry)
{
    throwIfSealed();
    throwIfChild();

    auto key = LedgerEntryKey(entry);
    if (!getNewestVersion(key))
    {
        throw std::runtime_error("Key does not exist");
    }

    auto current = entry;
    current.lastModifiedLedgerSeq = mHeader.ledgerSeq;
    mEntries[key] = current;
}

bool
LedgerTxn::exists(LedgerKey const& key)
{
    return getImpl().exists(key);
}

bool
LedgerTxn::Impl::exists(LedgerKey const& key) const
{
    throwIfSealed();
    throwIfChild();
    return static_cast<bool>(getNewestVersion(key));
}

LedgerEntryMap
LedgerTxn::getAllEntries(LedgerEntryType type) const
{
    return getImpl().getAllEntries(type);
}

LedgerEntryMap
LedgerTxn::Impl::getAllEntries(LedgerEntryType type) const
{
    throwIfSealed();

    auto res = mParent.getAllEntries(type);
    for (auto const& kv : mEntries)
    {
        if (kv.first.type() != type)
        {
            continue;
        }
        if (kv.second)
        {
            res[kv.first] = *kv.second;
        }
        else
        {
            res.erase(kv.first);
        }
    }
    return res;
}

LedgerHeader const&
LedgerTxn::getHeader() const
{
    return getImpl().getHeader();
}

LedgerHeader const&
LedgerTxn::Impl::getHeader() const
{
    throwIfSealed();
    return mHeader;
}

std::shared_ptr<LedgerEntry const>
LedgerTxn::getNewestVersion(LedgerKey const& key) const
{
    return getImpl().getNewestVersion(key);
}

std::shared_ptr<LedgerEntry const>
LedgerTxn::Impl::getNewestVersion(LedgerKey const& key) const
{
    auto iter = mEntries.find(key);
    if (iter != mEntries.end())
    {
        if (!iter->second)
        {
            return nullptr;
        }
        return std::make_shared<LedgerEntry const>(*iter->second);
    }
    return mParent.getNewestVersion(key);
}

std::optional<LedgerEntry>
LedgerTxn::load(LedgerKey const& key)
{
    return getImpl().load(key);
}

std::optional<LedgerEntry>
LedgerTxn::Impl::load(LedgerKey const& key) const
{
    throwIfSealed();
    throwIfChild();

    auto newest = getNewestVersion(key);
    if (!newest)
    {
        return std::nullopt;
    }
    return *newest;
}

LedgerHeader&
LedgerTxn::loadHeader()
{
    return getImpl().loadHeader();
}

LedgerHeader&
LedgerTxn::Impl::loadHeader()
{
    throwIfSealed();
    throwIfChild();
    return mHeader;
}

void
LedgerTxn::rollback()
{
    getImpl().rollback();
}

void
LedgerTxn::Impl::rollback() noexcept
{
    if (mChild)
    {
        mChild->rollback();
    }

    mEntries.clear();
    mParent.rollbackChild();
    mIsSealed = true;
}

void
LedgerTxn::rollbackChild()
{
    getImpl().rollbackChild();
}

void
LedgerTxn::Impl::rollbackChild() noexcept
{
    mChild = nullptr;
}

size_t
LedgerTxn::countChanges() const
{
    return getImpl().countChanges();
}

size_t
LedgerTxn::Impl::countChanges() const
{
    return mEntries.size();
}

bool
LedgerTxn::Impl::isSealed() const
{
    return mIsSealed;
}

// Implementation of InMemoryLedgerState ------------------------------------
InMemoryLedgerState::InMemoryLedgerState(LedgerHeader const& header)
    : mHeader(header)
{
}

void
InMemoryLedgerState::addChild(AbstractLedgerTxn& child)
{
    if (mChild)
    {
        throw std::runtime_error("InMemoryLedgerState already has child");
    }
    mChild = &child;
}

void
InMemoryLedgerState::commitChild(LedgerEntryChanges const& changes,
                                 LedgerHeader const& header)
{
    releaseAssert(mChild);

    for (auto const& kv : changes)
    {
        if (kv.second)
        {
            mEntries[kv.first] = *kv.second;
        }
        else
        {
            mEntries.erase(kv.first);
        }
    }
    mHeader = header;
    mChild = nullptr;
}

void
InMemoryLedgerState::rollbackChild()
{
    mChild = nullptr;
}

std::shared_ptr<LedgerEntry const>
InMemoryLedgerState::getNewestVersion(LedgerKey const& key) const
{
    auto iter = mEntries.find(key);
    if (iter == mEntries.end())
    {
        return nullptr;
    }
    return std::make_shared<LedgerEntry const>(iter->second);
}

LedgerEntryMap
InMemoryLedgerState::getAllEntries(LedgerEntryType type) const
{
    LedgerEntryMap res;
    for (auto const& kv : mEntries)
    {
        if (kv.first.type() == type)
        {
            res.emplace_hint(res.end(), kv.first, kv.second);
        }
    }
    return res;
}

LedgerHeader const&
InMemoryLedgerState::getHeader() const
{
    return mHeader;
}

size_t
InMemoryLedgerState::countObjects(LedgerEntryType type) const
{
    size_t count = 0;
    for (auto const& kv : mEntries)
    {
        if (kv.first.type() == type)
        {
            ++count;
        }
    }
    return count;
}

bool
InMemoryLedgerState::hasChild() const
{
    return mChild != nullptr;
}
}
