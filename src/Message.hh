//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_MESSAGE_HH
#define _RECURSED_MESSAGE_HH 1

#include "RR.hh"

namespace recursed {

#define	MSG_FLAG_QR	0x8000
#define	MSG_FLAG_RD	0x0100
#define	MSG_FLAG_RA	0x0080
#define	MSG_RCODE_MASK	0x000F

/**
 * @class		: Message
 * @attr		:
 *	- _id		: transaction identifier.
 *	- _is_response	: QR flag.
 *	- _rcode	: response code, or -1 if message is a query.
 *	- _rd		: recursion desired flag.
 *	- _ra		: recursion available flag.
 *	- _qstn		: list of question, as RR with name and type only.
 *	- _answ		: list of answer RR.
 *	- _auth		: list of authority RR.
 *	- _addt		: list of additional RR.
 * @desc		: DNS message in decoded form.
 *
 * Section counts in the header are never stored; `pack()` derive them from
 * the size of each list.
 */
class Message : public Object {
public:
	Message();
	~Message();

	const char* chars();

	void reset();
	int is_error();
	int set_question(const uint16_t type, const char* name);

	int pack(Buffer* out);
	int unpack(const char* msg, const int len);

	uint16_t	_id;
	uint8_t		_is_response;
	int		_rcode;
	uint8_t		_rd;
	uint8_t		_ra;

	List		_qstn;
	List		_answ;
	List		_auth;
	List		_addt;

	static uint16_t NEW_ID();
	static int PACK_HEADER_ERROR(Buffer* out, const uint16_t id
					, const int rcode);

	static const char* __cname;
private:
	Message(const Message&);
	void operator=(const Message&);

	int unpack_section(const char* msg, const int len, int* off
				, uint16_t count, List* section);
};

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
