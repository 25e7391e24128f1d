//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_RR_HH
#define _RECURSED_RR_HH 1

#include "common.hh"
#include "RRType.hh"

namespace recursed {

/**
 * @class	: RR
 * @attr	:
 *	- _type		: record type code.
 *	- _ttl		: time to live, in seconds; negative value means the
 *			  record never expire (root hints).
 *	- _fetched_at	: time when record is created or received from
 *			  upstream server.
 *	- _name		: owner name, lower-case, without trailing dot; root
 *			  is an empty name.
 *	- _value	: RDATA in textual form (see `rdata_kind`).
 * @desc	: Resource Record, one entry of DNS data.
 */
class RR : public Object {
public:
	RR(uint16_t type = 0, const char* name = NULL, const char* value = NULL
		, int32_t ttl = -1);
	~RR();

	const char* chars();

	double expiry();
	int is_expired(const double now);

	int set_name(const char* name);
	int set_value(const char* value);

	int pack_question(Buffer* out);
	int pack(Buffer* out);
	int pack_rdata(Buffer* out);
	int unpack_rdata(const char* msg, const int len, const int off
			, const uint16_t rdlen);

	uint16_t	_type;
	int32_t		_ttl;
	double		_fetched_at;
	Buffer		_name;
	Buffer		_value;

	static RR* COPY(RR* rr);
	static int NORMALIZE_NAME(Buffer* out, const char* name);

	static int PACK_U8(Buffer* out, const uint8_t v);
	static int PACK_U16(Buffer* out, const uint16_t v);
	static int PACK_U32(Buffer* out, const uint32_t v);
	static int UNPACK_U16(const char* msg, const int len, int* off
				, uint16_t* v);
	static int UNPACK_U32(const char* msg, const int len, int* off
				, uint32_t* v);

	static int PACK_NAME(Buffer* out, Buffer* name);
	static int UNPACK_NAME(const char* msg, const int len, int* off
				, Buffer* name);

	static int UNPACK_QUESTION(const char* msg, const int len, int* off
				, RR** rr);
	static int UNPACK(const char* msg, const int len, int* off, RR** rr);

	static const int TTL_MAX;
	static const char* __cname;
private:
	RR(const RR&);
	void operator=(const RR&);
};

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
