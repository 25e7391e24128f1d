/**
 * Copyright 2017 M. Shulhan (ms@kilabit.info). All rights reserved.
 * Use of this source code is governed by a BSD-style license that can be
 * found in the LICENSE file.
 */

#ifndef _RECURSED_RESOLVER_HH
#define	_RECURSED_RESOLVER_HH	1

#include "SSVReader.hh"
#include "Upstream.hh"

#define DEF_ETC_RESOLV "/etc/resolv.conf"
#define DEF_QTYPE "A"
#define OPT_NORECURSE "+norecurse"

using vos::Rowset;
using vos::SSVReader;
using vos::SockAddr;

#endif
