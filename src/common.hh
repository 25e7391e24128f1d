//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_COMMON_HH
#define _RECURSED_COMMON_HH 1

#include <stdint.h>
#include <sys/time.h>
#include "Dlogger.hh"
#include "Buffer.hh"
#include "List.hh"

using vos::Dlogger;
using vos::Object;
using vos::Buffer;
using vos::List;
using vos::BNode;

namespace recursed {

extern Dlogger	dlog;
extern int	_dbg;
extern uint8_t	_running;

#define	DBG_LVL_IS_1	(_dbg >= 1)
#define	DBG_LVL_IS_2	(_dbg >= 2)
#define	DBG_LVL_IS_3	(_dbg >= 3)

#define	RECURSED_DNS_PORT	53
#define	RECURSED_DEF_TIMEOUT	7
#define	RECURSED_DEF_MAX_HOPS	32
#define	RECURSED_HEADER_SIZE	12
#define	RECURSED_NAME_MAX	255
#define	RECURSED_LABEL_MAX	63

#define	TAG_QUERY	"query"
#define	TAG_CACHED	"cached"
#define	TAG_REFERRAL	"referral"
#define	TAG_UPSTREAM	"upstream"
#define	TAG_NXDOMAIN	"nxdomain"
#define	TAG_SERVFAIL	"servfail"
#define	TAG_FORMERR	"formerr"
#define	TAG_PREFETCH	"prefetch"

enum recursed_error {
	RECURSED_E_FORMAT	= -1
,	RECURSED_E_NAME		= -2
,	RECURSED_E_TRANSPORT	= -3
};

double time_now();
void list_clear(List* list);
int list_move(List* dst, List* src);

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
