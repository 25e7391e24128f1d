//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <string.h>
#include <strings.h>
#include "Recursor.hh"

namespace recursed {

// Returned by internal methods when cache has been updated by upstream
// answer and the question should be resolved again.
#define	RECURSOR_RETRY		2

// Returned by internal methods when upstream reply neither answer the
// question nor refer to a zone closer to the name.
#define	RECURSOR_NO_PROGRESS	3

const char* Recursor::__cname = "Recursor";

Recursor::Recursor(ZoneCache* cache, Upstream* upstream, const int max_hops)
: _cache(cache)
, _upstream(upstream)
, _max_hops(max_hops)
{}

Recursor::~Recursor()
{}

/**
 * @method		: Recursor::query
 * @param		:
 *	> type		: type of record to be resolved.
 *	> name		: domain name to be resolved.
 *	> recursive	: if 0, answer only from cache, with the closest
 *			  delegation as answer when name is not cached.
 *	> answers	: return value, list of answer records.
 *	> additional	: return value, list of additional records.
 * @return		:
 *	< RECURSOR_OK	     : answers and additional has been appended.
 *	< RECURSOR_NOT_EXIST : upstream server reply with NXDOMAIN; nothing
 *			       appended.
 *	< RECURSOR_FAIL	     : name can not be resolved.
 * @desc		: resolve one question.
 */
int Recursor::query(const uint16_t type, const char* name
			, const int recursive, List* answers
			, List* additional)
{
	int hops = 0;
	int s = resolve(type, name, recursive, answers, additional, &hops);

	if (DBG_LVL_IS_1) {
		switch (s) {
		case RECURSOR_NOT_EXIST:
			dlog.out("%8s: %3d %s\n", TAG_NXDOMAIN, type, name);
			break;
		case RECURSOR_FAIL:
			dlog.out("%8s: %3d %s (%d hops)\n", TAG_SERVFAIL
				, type, name, hops);
			break;
		}
	}

	return s;
}

//
// (1) Name is in cache with records of the requested type.
// (2) Name is in cache with CNAME.
// (3) Find the closest delegation.
// (4) In non-recursive mode, the delegation is the answer.
// (5) Ask the delegation. Answer from upstream is returned directly;
// a referral to a deeper zone make the question resolved again with the
// new cache.
//
int Recursor::resolve(const uint16_t type, const char* name
			, const int recursive, List* answers
			, List* additional, int* hops)
{
	int s = 0;
	int n = 0;
	int n_labels = 0;
	int n_matched = 0;
	int depth = 0;
	Zone* zone = NULL;
	RR* rr = NULL;
	List ns;

	while (1) {
		_cache->get_zone(name, &zone, &n_labels, &n_matched);

		if (n_labels == n_matched) {
			// (1)
			n = _cache->get_records(zone, type, answers);
			if (n > 0) {
				if (DBG_LVL_IS_1) {
					dlog.out("%8s: %3d %s\n", TAG_CACHED
						, type, name);
				}
				return RECURSOR_OK;
			}

			// (2)
			if (type != RR_T_CNAME) {
				n = _cache->get_records(zone, RR_T_CNAME
							, answers);
				if (n > 0) {
					if (DBG_LVL_IS_1) {
						dlog.out("%8s: %3d %s (cname)\n"
							, TAG_CACHED, type
							, name);
					}
					return RECURSOR_OK;
				}
			}
		}

		// (3)
		n = get_delegation(zone, &ns, &depth);
		if (n <= 0) {
			dlog.er("%s: no delegation found for '%s'!\n"
				, __cname, name);
			return RECURSOR_FAIL;
		}

		// (4)
		if (!recursive) {
			for (int x = 0; x < ns.size(); x++) {
				rr = (RR*) ns.at(x);
				_cache->lookup(rr->_value.is_empty() ? ""
						: rr->_value.v()
						, RR_T_A, additional);
			}

			list_move(answers, &ns);

			if (DBG_LVL_IS_1) {
				dlog.out("%8s: %3d %s\n", TAG_REFERRAL, type
					, name);
			}
			return RECURSOR_OK;
		}

		// (5)
		(*hops)++;
		if (*hops > _max_hops) {
			dlog.er("%s: maximum hops reached for '%s'\n", __cname
				, name);
			list_clear(&ns);
			return RECURSOR_FAIL;
		}

		s = ask_delegation(type, name, &ns, depth, answers, hops);

		list_clear(&ns);

		if (s != RECURSOR_RETRY) {
			return s;
		}
	}

	return RECURSOR_FAIL;
}

/**
 * `get_delegation()` will find the NS records starting from `zone` up to
 * the root, and append copy of them to `ns`. The number of labels in owner
 * of NS records is returned in `depth`.
 * It will return number of NS records found.
 */
int Recursor::get_delegation(Zone* zone, List* ns, int* depth)
{
	int n = 0;
	Zone* z = NULL;

	while (zone) {
		n = _cache->get_records(zone, RR_T_NS, ns);
		if (n > 0) {
			*depth = 0;
			for (z = zone; z->_parent; z = z->_parent) {
				(*depth)++;
			}
			return n;
		}
		zone = zone->_parent;
	}

	return 0;
}

/**
 * `ask_delegation()` will query upstream name servers listed in `ns`,
 * using the address of each server that is already in cache. `depth` is
 * the number of labels of the delegation zone.
 *
 * If none of the servers has address in cache, each server name is resolved
 * recursively first.
 *
 * It will return,
 *	- RECURSOR_OK if upstream answer the question, with answer records
 *	  appended to `answers`, or if no server give any progress,
 *	- RECURSOR_RETRY if upstream refer to a deeper zone and the referral
 *	  has been inserted into cache,
 *	- RECURSOR_NOT_EXIST if upstream answer with NXDOMAIN,
 *	- RECURSOR_FAIL if all servers fail.
 */
int Recursor::ask_delegation(const uint16_t type, const char* name, List* ns
				, const int depth, List* answers, int* hops)
{
	int s = 0;
	int has_address = 0;
	int no_progress = 0;
	RR* rr = NULL;
	List addresses;
	List additional;
	const char* target = NULL;

	for (int x = 0; x < ns->size(); x++) {
		rr = (RR*) ns->at(x);
		target = rr->_value.is_empty() ? "" : rr->_value.v();

		_cache->lookup(target, RR_T_A, &addresses);
		if (addresses.size() <= 0) {
			continue;
		}

		has_address = 1;

		s = ask_addresses(type, name, &addresses, depth, answers);
		list_clear(&addresses);

		if (s == RECURSOR_NO_PROGRESS) {
			no_progress = 1;
			continue;
		}
		if (s != RECURSOR_FAIL) {
			return s;
		}
	}

	// No glue for any of name servers.
	for (int x = 0; !has_address && x < ns->size(); x++) {
		rr = (RR*) ns->at(x);
		target = rr->_value.is_empty() ? "" : rr->_value.v();

		if (DBG_LVL_IS_2) {
			dlog.out("%s: resolving name server %s\n", __cname
				, target);
		}

		s = resolve(RR_T_A, target, 1, &addresses, &additional, hops);
		list_clear(&additional);

		if (s == RECURSOR_OK && addresses.size() > 0) {
			s = ask_addresses(type, name, &addresses, depth
						, answers);
		} else {
			s = RECURSOR_FAIL;
		}

		list_clear(&addresses);

		if (s == RECURSOR_NO_PROGRESS) {
			no_progress = 1;
			continue;
		}
		if (s != RECURSOR_FAIL) {
			return s;
		}
	}

	if (no_progress) {
		if (DBG_LVL_IS_1) {
			dlog.out("%8s: %3d %s (no progress)\n", TAG_UPSTREAM
				, type, name);
		}
		return RECURSOR_OK;
	}

	return RECURSOR_FAIL;
}

//
// `ask_addresses()` will send the question to each A record in `addresses`
// until one of them give a valid answer.
//
// (1) Reply that answer the question is returned directly, so record with
// zero TTL is not lost between inserting and reading it back from cache.
// (2) Reply that refer to a zone deeper than `depth` is cached, and the
// question should be resolved again.
// (3) Anything else, e.g. lame or self referral, is not cached and the
// next address is tried.
//
int Recursor::ask_addresses(const uint16_t type, const char* name
				, List* addresses, const int depth
				, List* answers)
{
	int s = 0;
	int no_progress = 0;
	RR* addr = NULL;
	Buffer qname;
	Message query;
	Message answer;

	RR::NORMALIZE_NAME(&qname, name);

	for (int x = 0; x < addresses->size(); x++) {
		addr = (RR*) addresses->at(x);
		if (addr->_type != RR_T_A || addr->_value.is_empty()) {
			continue;
		}

		query.set_question(type, name);
		query._rd = 0;
		answer.reset();

		if (DBG_LVL_IS_1) {
			dlog.out("%8s: %3d %s @%s\n", TAG_UPSTREAM, type, name
				, addr->_value.v());
		}

		s = _upstream->ask(addr->_value.v(), &query, &answer);
		if (s != 0) {
			continue;
		}

		if (answer._rcode == RCODE_NXDOMAIN) {
			return RECURSOR_NOT_EXIST;
		}
		if (answer.is_error()) {
			if (DBG_LVL_IS_2) {
				dlog.out("%s: %s from %s\n", __cname
					, RCode::GET_NAME(answer._rcode)
					, addr->_value.v());
			}
			continue;
		}

		// (1)
		if (get_answers(type, qname.is_empty() ? "" : qname.v()
				, &answer, answers) > 0) {
			ingest(&answer);
			return RECURSOR_OK;
		}

		// (2)
		if (is_progress(qname.is_empty() ? "" : qname.v(), &answer
				, depth)) {
			ingest(&answer);
			return RECURSOR_RETRY;
		}

		// (3)
		if (DBG_LVL_IS_2) {
			dlog.out("%s: no progress from %s\n", __cname
				, addr->_value.v());
		}
		no_progress = 1;
	}

	return no_progress ? RECURSOR_NO_PROGRESS : RECURSOR_FAIL;
}

//
// `get_answers()` will append copy of records in answer section that is
// owned by `name` with type `type` to `answers`. If there is none, CNAME
// records owned by `name` are appended instead.
// It will return number of records appended.
//
int Recursor::get_answers(const uint16_t type, const char* name
				, Message* answer, List* answers)
{
	int n = 0;
	RR* rr = NULL;
	uint16_t t = type;

	while (1) {
		for (int x = 0; x < answer->_answ.size(); x++) {
			rr = (RR*) answer->_answ.at(x);

			if (rr->_type != t) {
				continue;
			}
			if (strcasecmp(rr->_name.is_empty() ? ""
					: rr->_name.v(), name) != 0) {
				continue;
			}

			answers->push_tail(RR::COPY(rr));
			n++;
		}

		if (n > 0 || t == RR_T_CNAME) {
			break;
		}
		t = RR_T_CNAME;
	}

	return n;
}

//
// `is_progress()` will return 1 if `answer` contain NS records of a zone
// that is deeper than `depth` labels and that hold `name`.
//
int Recursor::is_progress(const char* name, Message* answer
				, const int depth)
{
	RR* rr = NULL;
	const char* owner = NULL;
	List* sections[] = { &answer->_answ, &answer->_auth };

	for (int y = 0; y < 2; y++) {
		for (int x = 0; x < sections[y]->size(); x++) {
			rr = (RR*) sections[y]->at(x);
			if (rr->_type != RR_T_NS) {
				continue;
			}

			owner = rr->_name.is_empty() ? "" : rr->_name.v();

			if (COUNT_LABELS(owner) <= depth) {
				continue;
			}
			if (IS_SUBDOMAIN(name, owner)) {
				return 1;
			}
		}
	}

	return 0;
}

//
// `ingest()` will insert all records in answer, authority, and additional
// section of `answer` into cache. It will return the number of records
// inserted.
//
int Recursor::ingest(Message* answer)
{
	int n = 0;

	n += _cache->insert(&answer->_answ);
	n += _cache->insert(&answer->_auth);
	n += _cache->insert(&answer->_addt);

	return n;
}

/**
 * `COUNT_LABELS()` will return number of labels in normalized `name`.
 * Root name has no label.
 */
int Recursor::COUNT_LABELS(const char* name)
{
	int n = 0;

	if (!name || !name[0]) {
		return 0;
	}

	for (n = 1; *name; name++) {
		if (*name == '.') {
			n++;
		}
	}

	return n;
}

/**
 * `IS_SUBDOMAIN()` will return 1 if `name` is equal to `owner` or is
 * under zone `owner`, or 0 otherwise. Both names must be normalized.
 */
int Recursor::IS_SUBDOMAIN(const char* name, const char* owner)
{
	size_t nlen = 0;
	size_t olen = 0;

	if (!owner || !owner[0]) {
		return 1;
	}
	if (!name) {
		return 0;
	}

	nlen = strlen(name);
	olen = strlen(owner);

	if (olen > nlen) {
		return 0;
	}
	if (strcasecmp(&name[nlen - olen], owner) != 0) {
		return 0;
	}
	if (olen == nlen) {
		return 1;
	}

	return name[nlen - olen - 1] == '.';
}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
