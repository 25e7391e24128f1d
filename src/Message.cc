//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <stdlib.h>
#include "Message.hh"

namespace recursed {

const char* Message::__cname = "Message";

Message::Message()
: Object()
, _id(0)
, _is_response(0)
, _rcode(-1)
, _rd(0)
, _ra(0)
, _qstn()
, _answ()
, _auth()
, _addt()
{}

Message::~Message()
{
	reset();
}

static void chars_section(Buffer* b, const char* title, List* section)
{
	int x = 0;

	b->append_fmt(";; %s SECTION: %d\n", title, section->size());

	for (; x < section->size(); x++) {
		b->append_fmt("%s\n", section->at(x)->chars());
	}
}

const char* Message::chars()
{
	Buffer b;
	int x = 0;
	RR* q = NULL;

	if (__str) {
		free(__str);
		__str = NULL;
	}

	b.append_fmt(";; id: %d, qr: %d, rd: %d, ra: %d, status: %s\n"
		, _id, _is_response, _rd, _ra
		, _rcode < 0 ? "-" : RCode::GET_NAME(_rcode));

	b.append_fmt(";; QUESTION SECTION: %d\n", _qstn.size());
	for (; x < _qstn.size(); x++) {
		q = (RR*) _qstn.at(x);
		b.append_fmt(";%s.\tIN\t%s\n"
			, q->_name.is_empty() ? "" : q->_name.v()
			, RRType::GET_NAME(q->_type));
	}

	chars_section(&b, "ANSWER", &_answ);
	chars_section(&b, "AUTHORITY", &_auth);
	chars_section(&b, "ADDITIONAL", &_addt);

	__str = b.detach();

	return __str;
}

/**
 * `reset()` will clear all header fields and release all records in each
 * section.
 */
void Message::reset()
{
	_id = 0;
	_is_response = 0;
	_rcode = -1;
	_rd = 0;
	_ra = 0;

	list_clear(&_qstn);
	list_clear(&_answ);
	list_clear(&_auth);
	list_clear(&_addt);
}

//
// `is_error()` will return 1 if message has response code other than
// NOERROR and NXDOMAIN.
//
int Message::is_error()
{
	if (_rcode < 0) {
		return 0;
	}
	return _rcode != RCODE_NOERROR && _rcode != RCODE_NXDOMAIN;
}

/**
 * `set_question()` will reset message and make it a query with single
 * question `name` of record `type`.
 */
int Message::set_question(const uint16_t type, const char* name)
{
	reset();

	_id = NEW_ID();
	_qstn.push_tail(new RR(type, name));

	return 0;
}

/**
 * `pack()` will append wire format of message to `out`.
 * It will return 0 on success, or one of RECURSED_E_* code if one of the
 * record can not be encoded.
 */
int Message::pack(Buffer* out)
{
	int s = 0;
	int x = 0;
	uint16_t flags = 0;
	List* sections[] = { &_answ, &_auth, &_addt };

	if (_is_response || _rcode >= 0) {
		flags |= MSG_FLAG_QR;
	}
	if (_rd) {
		flags |= MSG_FLAG_RD;
	}
	if (_ra) {
		flags |= MSG_FLAG_RA;
	}
	if (_rcode > 0) {
		flags |= (uint16_t) (_rcode & MSG_RCODE_MASK);
	}

	RR::PACK_U16(out, _id);
	RR::PACK_U16(out, flags);
	RR::PACK_U16(out, (uint16_t) _qstn.size());
	RR::PACK_U16(out, (uint16_t) _answ.size());
	RR::PACK_U16(out, (uint16_t) _auth.size());
	RR::PACK_U16(out, (uint16_t) _addt.size());

	for (x = 0; x < _qstn.size(); x++) {
		s = ((RR*) _qstn.at(x))->pack_question(out);
		if (s != 0) {
			return s;
		}
	}

	for (int i = 0; i < 3; i++) {
		for (x = 0; x < sections[i]->size(); x++) {
			s = ((RR*) sections[i]->at(x))->pack(out);
			if (s != 0) {
				return s;
			}
		}
	}

	return 0;
}

int Message::unpack_section(const char* msg, const int len, int* off
				, uint16_t count, List* section)
{
	int s = 0;
	RR* rr = NULL;

	for (; count > 0; count--) {
		s = RR::UNPACK(msg, len, off, &rr);
		if (s != 0) {
			return s;
		}

		section->push_tail(rr);
		rr = NULL;
	}

	return 0;
}

/**
 * `unpack()` will decode message from `len` bytes of `msg`.
 * It will return 0 on success or RECURSED_E_FORMAT if message is truncated
 * or malformed, in which case content of message is undefined.
 */
int Message::unpack(const char* msg, const int len)
{
	int s = 0;
	int off = 0;
	uint16_t flags = 0;
	uint16_t qdcount = 0;
	uint16_t ancount = 0;
	uint16_t nscount = 0;
	uint16_t arcount = 0;
	RR* q = NULL;

	reset();

	if (!msg || len < RECURSED_HEADER_SIZE) {
		return RECURSED_E_FORMAT;
	}

	RR::UNPACK_U16(msg, len, &off, &_id);
	RR::UNPACK_U16(msg, len, &off, &flags);
	RR::UNPACK_U16(msg, len, &off, &qdcount);
	RR::UNPACK_U16(msg, len, &off, &ancount);
	RR::UNPACK_U16(msg, len, &off, &nscount);
	RR::UNPACK_U16(msg, len, &off, &arcount);

	_is_response = (flags & MSG_FLAG_QR) ? 1 : 0;
	_rd = (flags & MSG_FLAG_RD) ? 1 : 0;
	_ra = (flags & MSG_FLAG_RA) ? 1 : 0;
	_rcode = _is_response ? (int) (flags & MSG_RCODE_MASK) : -1;

	for (; qdcount > 0; qdcount--) {
		s = RR::UNPACK_QUESTION(msg, len, &off, &q);
		if (s != 0) {
			return s;
		}

		_qstn.push_tail(q);
		q = NULL;
	}

	s = unpack_section(msg, len, &off, ancount, &_answ);
	if (s != 0) {
		return s;
	}

	s = unpack_section(msg, len, &off, nscount, &_auth);
	if (s != 0) {
		return s;
	}

	return unpack_section(msg, len, &off, arcount, &_addt);
}

//{{{ STATIC METHODS

uint16_t Message::NEW_ID()
{
	return (uint16_t) (random() & 0xFFFF);
}

/**
 * `PACK_HEADER_ERROR()` will write a response with header only, without
 * any section, with transaction `id` and response code `rcode`.
 */
int Message::PACK_HEADER_ERROR(Buffer* out, const uint16_t id
				, const int rcode)
{
	uint16_t flags = MSG_FLAG_QR | MSG_FLAG_RA
			| (uint16_t) (rcode & MSG_RCODE_MASK);

	out->reset();

	RR::PACK_U16(out, id);
	RR::PACK_U16(out, flags);
	RR::PACK_U16(out, 0);
	RR::PACK_U16(out, 0);
	RR::PACK_U16(out, 0);
	RR::PACK_U16(out, 0);

	return 0;
}

//}}}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
