/**
 * Copyright 2017 M. Shulhan (ms@kilabit.info). All rights reserved.
 * Use of this source code is governed by a BSD-style license that can be
 * found in the LICENSE file.
 */

#ifndef _RECURSED_RR_TYPE_HH
#define _RECURSED_RR_TYPE_HH 1

#include <stdint.h>

namespace recursed {

enum rr_type {
	RR_T_A		= 1
,	RR_T_NS		= 2
,	RR_T_CNAME	= 5
,	RR_T_SOA	= 6
,	RR_T_PTR	= 12
,	RR_T_MX		= 15
,	RR_T_TXT	= 16
,	RR_T_AAAA	= 28
,	RR_T_OPT	= 41
,	RR_T_ANY	= 255
};

enum rr_class {
	RR_C_IN		= 1
};

enum rcode_value {
	RCODE_NOERROR	= 0
,	RCODE_FORMERR	= 1
,	RCODE_SERVFAIL	= 2
,	RCODE_NXDOMAIN	= 3
,	RCODE_NOTIMP	= 4
,	RCODE_REFUSED	= 5
};

/**
 * How RDATA of a record is represented in `RR::_value`.
 *
 *	- RDATA_IS_INET4  : dotted-quad text, 4 bytes on the wire.
 *	- RDATA_IS_INET6  : eight colon separated hex groups, 16 bytes.
 *	- RDATA_IS_NAME   : domain name, possibly compressed on the wire.
 *	- RDATA_IS_OPAQUE : raw bytes, copied as is.
 */
enum rdata_kind {
	RDATA_IS_OPAQUE	= 0
,	RDATA_IS_INET4	= 1
,	RDATA_IS_INET6	= 2
,	RDATA_IS_NAME	= 3
};

class RRType {
public:
	static const int	SIZE;
	static const char*	NAMES[];
	static const uint16_t	VALUES[];
	static const char*	UNKNOWN;

	static int GET_VALUE(const char* name);
	static const char* GET_NAME(const uint16_t type);
	static rdata_kind GET_RDATA_KIND(const uint16_t type);
	static int IS_CACHEABLE(const uint16_t type);
private:
	RRType();
	RRType(const RRType&);
	void operator=(const RRType&);
};

class RCode {
public:
	static const int	SIZE;
	static const char*	NAMES[];
	static const uint16_t	VALUES[];

	static int GET_VALUE(const char* name);
	static const char* GET_NAME(const int rcode);
private:
	RCode();
	RCode(const RCode&);
	void operator=(const RCode&);
};

} /* namespace::recursed */

#endif
