//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_RECURSOR_HH
#define _RECURSED_RECURSOR_HH 1

#include "ZoneCache.hh"
#include "Upstream.hh"

namespace recursed {

enum recursor_status {
	RECURSOR_FAIL		= -1
,	RECURSOR_OK		= 0
,	RECURSOR_NOT_EXIST	= 1
};

/**
 * @class		: Recursor
 * @attr		:
 *	- _cache	: zone cache, shared with server.
 *	- _upstream	: transport to upstream name servers.
 *	- _max_hops	: maximum number of upstream delegation queries for
 *			  one question.
 * @desc		: resolve a question using cache and, if recursion is
 * requested, by following delegation from the closest cached zone down to
 * the zone that hold the name.
 */
class Recursor {
public:
	Recursor(ZoneCache* cache, Upstream* upstream
		, const int max_hops = RECURSED_DEF_MAX_HOPS);
	~Recursor();

	int query(const uint16_t type, const char* name, const int recursive
			, List* answers, List* additional);

	static int COUNT_LABELS(const char* name);
	static int IS_SUBDOMAIN(const char* name, const char* owner);

	ZoneCache*	_cache;
	Upstream*	_upstream;
	int		_max_hops;

	static const char* __cname;
private:
	Recursor(const Recursor&);
	void operator=(const Recursor&);

	int resolve(const uint16_t type, const char* name
			, const int recursive, List* answers
			, List* additional, int* hops);
	int get_delegation(Zone* zone, List* ns, int* depth);
	int ask_delegation(const uint16_t type, const char* name, List* ns
				, const int depth, List* answers, int* hops);
	int ask_addresses(const uint16_t type, const char* name
				, List* addresses, const int depth
				, List* answers);
	int get_answers(const uint16_t type, const char* name
			, Message* answer, List* answers);
	int is_progress(const char* name, Message* answer, const int depth);
	int ingest(Message* answer);
};

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
