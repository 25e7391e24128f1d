//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <arpa/inet.h>
#include <ctype.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include "RR.hh"

namespace recursed {

#define	RR_POINTER_MAX	16

const char* RR::__cname = "RR";
const int RR::TTL_MAX = 0x7FFFFFFF;

RR::RR(uint16_t type, const char* name, const char* value, int32_t ttl)
: Object()
, _type(type)
, _ttl(ttl)
, _fetched_at(time_now())
, _name()
, _value()
{
	if (name) {
		set_name(name);
	}
	if (value) {
		set_value(value);
	}
}

RR::~RR()
{}

const char* RR::chars()
{
	Buffer b;

	if (__str) {
		free(__str);
		__str = NULL;
	}

	b.append_fmt("%s.\t%d\tIN\t%s\t%s"
		, _name.is_empty() ? "" : _name.v()
		, _ttl
		, RRType::GET_NAME(_type)
		, _value.is_empty() ? "" : _value.v());

	__str = b.detach();

	return __str;
}

/**
 * `expiry()` will return the time when this record is expired, or
 * positive infinity if TTL is negative.
 */
double RR::expiry()
{
	if (_ttl < 0) {
		return HUGE_VAL;
	}
	return _fetched_at + (double) _ttl;
}

int RR::is_expired(const double now)
{
	return now > expiry();
}

int RR::set_name(const char* name)
{
	return NORMALIZE_NAME(&_name, name);
}

//
// `set_value()` will set textual RDATA. Domain name values are normalized
// the same way as owner name.
//
int RR::set_value(const char* value)
{
	if (RRType::GET_RDATA_KIND(_type) == RDATA_IS_NAME) {
		return NORMALIZE_NAME(&_value, value);
	}

	_value.reset();
	if (!value || !value[0]) {
		return 0;
	}
	return _value.copy_raw(value);
}

/**
 * `pack_question()` will append this record to `out` in question wire
 * format: QNAME, QTYPE, and QCLASS.
 */
int RR::pack_question(Buffer* out)
{
	int s = PACK_NAME(out, &_name);
	if (s != 0) {
		return s;
	}

	PACK_U16(out, _type);
	PACK_U16(out, RR_C_IN);

	return 0;
}

/**
 * `pack()` will append this record to `out` in resource record wire
 * format. Name is never compressed. Negative TTL is written as the maximum
 * positive value.
 */
int RR::pack(Buffer* out)
{
	Buffer rdata;
	uint32_t ttl = (_ttl < 0) ? (uint32_t) TTL_MAX : (uint32_t) _ttl;

	int s = pack_rdata(&rdata);
	if (s != 0) {
		return s;
	}
	if (rdata.len() > 0xFFFF) {
		return RECURSED_E_FORMAT;
	}

	s = PACK_NAME(out, &_name);
	if (s != 0) {
		return s;
	}

	PACK_U16(out, _type);
	PACK_U16(out, RR_C_IN);
	PACK_U32(out, ttl);
	PACK_U16(out, (uint16_t) rdata.len());

	if (rdata.len() > 0) {
		out->append_raw(rdata.v(), rdata.len());
	}

	return 0;
}

int RR::pack_rdata(Buffer* out)
{
	unsigned char addr[16];

	switch (RRType::GET_RDATA_KIND(_type)) {
	case RDATA_IS_INET4:
		if (_value.is_empty()
		|| inet_pton(AF_INET, _value.v(), addr) != 1) {
			return RECURSED_E_FORMAT;
		}
		out->append_raw((const char*) addr, 4);
		break;

	case RDATA_IS_INET6:
		if (_value.is_empty()
		|| inet_pton(AF_INET6, _value.v(), addr) != 1) {
			return RECURSED_E_FORMAT;
		}
		out->append_raw((const char*) addr, 16);
		break;

	case RDATA_IS_NAME:
		return PACK_NAME(out, &_value);

	case RDATA_IS_OPAQUE:
		if (_value.len() > 0) {
			out->append_raw(_value.v(), _value.len());
		}
		break;
	}

	return 0;
}

/**
 * `unpack_rdata()` will decode `rdlen` bytes of RDATA, started at `off`
 * in message `msg`, into `_value`. Compressed names inside RDATA are
 * resolved against the whole message.
 */
int RR::unpack_rdata(const char* msg, const int len, const int off
			, const uint16_t rdlen)
{
	int s = 0;
	int p = off;
	char str[64];
	const unsigned char* rd = (const unsigned char*) &msg[off];

	if (off + rdlen > len) {
		return RECURSED_E_FORMAT;
	}

	_value.reset();

	switch (RRType::GET_RDATA_KIND(_type)) {
	case RDATA_IS_INET4:
		if (rdlen != 4) {
			return RECURSED_E_FORMAT;
		}
		snprintf(str, sizeof(str), "%d.%d.%d.%d"
			, rd[0], rd[1], rd[2], rd[3]);
		_value.copy_raw(str);
		break;

	case RDATA_IS_INET6:
		if (rdlen != 16) {
			return RECURSED_E_FORMAT;
		}
		snprintf(str, sizeof(str)
			, "%04x:%04x:%04x:%04x:%04x:%04x:%04x:%04x"
			, (rd[0] << 8) | rd[1], (rd[2] << 8) | rd[3]
			, (rd[4] << 8) | rd[5], (rd[6] << 8) | rd[7]
			, (rd[8] << 8) | rd[9], (rd[10] << 8) | rd[11]
			, (rd[12] << 8) | rd[13], (rd[14] << 8) | rd[15]);
		_value.copy_raw(str);
		break;

	case RDATA_IS_NAME:
		s = UNPACK_NAME(msg, len, &p, &_value);
		if (s != 0) {
			return s;
		}
		if (p > off + rdlen) {
			return RECURSED_E_FORMAT;
		}
		break;

	case RDATA_IS_OPAQUE:
		if (rdlen > 0) {
			_value.append_raw(&msg[off], rdlen);
		}
		break;
	}

	return 0;
}

//{{{ STATIC METHODS

RR* RR::COPY(RR* rr)
{
	if (!rr) {
		return NULL;
	}

	RR* o = new RR(rr->_type, NULL, NULL, rr->_ttl);

	o->_fetched_at = rr->_fetched_at;
	o->_name.copy(&rr->_name);
	o->_value.copy(&rr->_value);

	return o;
}

/**
 * `NORMALIZE_NAME()` will copy domain `name` into `out` with surrounding
 * spaces and trailing dot removed, and all characters converted to
 * lower-case. The root name "." become an empty name.
 */
int RR::NORMALIZE_NAME(Buffer* out, const char* name)
{
	int start = 0;
	int end = 0;
	char c;

	out->reset();

	if (!name) {
		return 0;
	}

	end = 0;
	while (name[end]) {
		end++;
	}

	while (start < end && isspace((unsigned char) name[start])) {
		start++;
	}
	while (end > start && isspace((unsigned char) name[end - 1])) {
		end--;
	}
	if (end > start && name[end - 1] == '.') {
		end--;
	}

	for (; start < end; start++) {
		c = (char) tolower((unsigned char) name[start]);
		out->append_raw(&c, 1);
	}

	return 0;
}

int RR::PACK_U8(Buffer* out, const uint8_t v)
{
	char c = (char) v;

	return out->append_raw(&c, 1);
}

int RR::PACK_U16(Buffer* out, const uint16_t v)
{
	char b[2];

	b[0] = (char) ((v >> 8) & 0xFF);
	b[1] = (char) (v & 0xFF);

	return out->append_raw(b, 2);
}

int RR::PACK_U32(Buffer* out, const uint32_t v)
{
	char b[4];

	b[0] = (char) ((v >> 24) & 0xFF);
	b[1] = (char) ((v >> 16) & 0xFF);
	b[2] = (char) ((v >> 8) & 0xFF);
	b[3] = (char) (v & 0xFF);

	return out->append_raw(b, 4);
}

int RR::UNPACK_U16(const char* msg, const int len, int* off, uint16_t* v)
{
	const unsigned char* p = (const unsigned char*) msg;

	if ((*off) + 2 > len) {
		return RECURSED_E_FORMAT;
	}

	(*v) = (uint16_t) ((p[*off] << 8) | p[(*off) + 1]);
	(*off) += 2;

	return 0;
}

int RR::UNPACK_U32(const char* msg, const int len, int* off, uint32_t* v)
{
	const unsigned char* p = (const unsigned char*) msg;

	if ((*off) + 4 > len) {
		return RECURSED_E_FORMAT;
	}

	(*v) = ((uint32_t) p[*off] << 24)
		| ((uint32_t) p[(*off) + 1] << 16)
		| ((uint32_t) p[(*off) + 2] << 8)
		| (uint32_t) p[(*off) + 3];
	(*off) += 4;

	return 0;
}

/**
 * `PACK_NAME()` will append domain `name` to `out` as a sequence of
 * length-prefixed labels terminated by a zero byte.
 *
 * It will return `RECURSED_E_NAME` if one of the label is empty or longer
 * than 63 bytes, or the encoded name is longer than 255 bytes.
 */
int RR::PACK_NAME(Buffer* out, Buffer* name)
{
	int x = 0;
	int start = 0;
	int total = 1;
	int len = (int) name->len();
	const char* v = len > 0 ? name->v() : NULL;

	while (x <= len && len > 0) {
		if (x < len && v[x] != '.') {
			x++;
			continue;
		}

		int llen = x - start;

		if (llen <= 0 || llen > RECURSED_LABEL_MAX) {
			return RECURSED_E_NAME;
		}

		total += 1 + llen;
		if (total > RECURSED_NAME_MAX) {
			return RECURSED_E_NAME;
		}

		PACK_U8(out, (uint8_t) llen);
		out->append_raw(&v[start], (size_t) llen);

		x++;
		start = x;
	}

	return PACK_U8(out, 0);
}

/**
 * `UNPACK_NAME()` will decode domain name started at offset `off` in
 * message `msg` into `name`, and move `off` to the byte after the name.
 *
 * A label length with its top two bits set is a compression pointer: the
 * next 14 bits are an offset into `msg` from where labels continue, and the
 * name in the current position ends with the pointer. A pointer target
 * may contain another pointer; jumps are bounded to catch pointer loops.
 *
 * It will return `RECURSED_E_FORMAT` if name is truncated, longer than
 * 255 bytes, use reserved label type, or loop.
 */
int RR::UNPACK_NAME(const char* msg, const int len, int* off, Buffer* name)
{
	const unsigned char* p = (const unsigned char*) msg;
	int pos = *off;
	int jumped = 0;
	int njump = 0;
	int llen = 0;
	int ptr = 0;
	char c;

	name->reset();

	while (1) {
		if (pos >= len) {
			return RECURSED_E_FORMAT;
		}

		llen = p[pos];

		if (llen == 0) {
			pos++;
			break;
		}

		if ((llen & 0xC0) == 0xC0) {
			if (pos + 1 >= len) {
				return RECURSED_E_FORMAT;
			}

			ptr = ((llen & 0x3F) << 8) | p[pos + 1];

			if (!jumped) {
				(*off) = pos + 2;
				jumped = 1;
			}
			if (ptr >= len || ++njump > RR_POINTER_MAX) {
				return RECURSED_E_FORMAT;
			}

			pos = ptr;
			continue;
		}

		if ((llen & 0xC0) != 0) {
			return RECURSED_E_FORMAT;
		}
		if (pos + 1 + llen > len) {
			return RECURSED_E_FORMAT;
		}

		if (name->len() > 0) {
			name->append_raw(".", 1);
		}
		for (int x = 1; x <= llen; x++) {
			c = (char) tolower(p[pos + x]);
			name->append_raw(&c, 1);
		}
		if ((int) name->len() > RECURSED_NAME_MAX) {
			return RECURSED_E_FORMAT;
		}

		pos += 1 + llen;
	}

	if (!jumped) {
		(*off) = pos;
	}

	return 0;
}

/**
 * `UNPACK_QUESTION()` will decode one question entry started at `off`.
 * Question class is ignored and assumed to be IN.
 */
int RR::UNPACK_QUESTION(const char* msg, const int len, int* off, RR** rr)
{
	int s = 0;
	uint16_t type = 0;
	uint16_t qclass = 0;
	RR* o = new RR();

	s = UNPACK_NAME(msg, len, off, &o->_name);
	if (s != 0) {
		goto err;
	}

	s = UNPACK_U16(msg, len, off, &type);
	if (s != 0) {
		goto err;
	}

	s = UNPACK_U16(msg, len, off, &qclass);
	if (s != 0) {
		goto err;
	}

	o->_type = type;
	(*rr) = o;

	return 0;
err:
	delete o;
	return s;
}

/**
 * `UNPACK()` will decode one resource record started at `off`.
 *
 * TTL with the most significant bit set is treated as zero, so a received
 * record never become a non-expiring one.
 */
int RR::UNPACK(const char* msg, const int len, int* off, RR** rr)
{
	int s = 0;
	uint16_t type = 0;
	uint16_t rclass = 0;
	uint16_t rdlen = 0;
	uint32_t ttl = 0;
	RR* o = new RR();

	s = UNPACK_NAME(msg, len, off, &o->_name);
	if (s != 0) {
		goto err;
	}

	s = UNPACK_U16(msg, len, off, &type);
	if (s != 0) {
		goto err;
	}

	s = UNPACK_U16(msg, len, off, &rclass);
	if (s != 0) {
		goto err;
	}

	s = UNPACK_U32(msg, len, off, &ttl);
	if (s != 0) {
		goto err;
	}

	s = UNPACK_U16(msg, len, off, &rdlen);
	if (s != 0) {
		goto err;
	}

	o->_type = type;
	o->_ttl = (ttl > (uint32_t) TTL_MAX) ? 0 : (int32_t) ttl;

	s = o->unpack_rdata(msg, len, *off, rdlen);
	if (s != 0) {
		goto err;
	}

	(*off) += rdlen;
	(*rr) = o;

	return 0;
err:
	delete o;
	return s;
}

//}}}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
