#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include <xdrpp/types.h>

namespace nftsim
{
// xdrpp defines comparison for every generated type in namespace xdr; make
// them visible to unqualified lookup in our namespace.
using xdr::operator<;
using xdr::operator==;
}
