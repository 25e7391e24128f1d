//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <math.h>
#include <stdlib.h>
#include <strings.h>
#include "Zone.hh"

namespace recursed {

const char* Zone::__cname = "Zone";

Zone::Zone(Zone* parent, const char* label)
: Object()
, _label()
, _parent(parent)
, _child()
, _rr()
{
	if (label && label[0]) {
		_label.copy_raw(label);
	}
}

Zone::~Zone()
{
	list_clear(&_rr);
	list_clear(&_child);
}

const char* Zone::chars()
{
	Buffer b;

	if (__str) {
		free(__str);
		__str = NULL;
	}

	get_name(&b);
	b.append_fmt(" (%d records, %d sub-zones)", _rr.size()
		, _child.size());

	__str = b.detach();

	return __str;
}

Zone* Zone::get_child(const char* label, const int len)
{
	Zone* z = NULL;

	for (int x = 0; x < _child.size(); x++) {
		z = (Zone*) _child.at(x);

		if ((int) z->_label.len() != len) {
			continue;
		}
		if (strncasecmp(z->_label.v(), label, (size_t) len) == 0) {
			return z;
		}
	}

	return NULL;
}

//
// `add_child()` will create new sub-zone with `label` and return it.
// Caller must make sure that the label is not exist yet.
//
Zone* Zone::add_child(const char* label, const int len)
{
	Zone* z = new Zone(this);

	if (len > 0) {
		z->_label.copy_raw(label, (size_t) len);
	}

	_child.push_tail(z);

	return z;
}

//
// `add()` will append record `rr` to this zone. Zone own the record.
//
void Zone::add(RR* rr)
{
	_rr.push_tail(rr);
}

/**
 * `purge()` will remove and release all expired records in this zone.
 * It will return number of records removed.
 */
int Zone::purge(const double now)
{
	int n = 0;
	int size = _rr.size();
	BNode* node = NULL;
	RR* rr = NULL;

	for (; size > 0; size--) {
		node = _rr.node_pop_head();
		rr = (RR*) node->get_content();

		if (rr->is_expired(now)) {
			if (DBG_LVL_IS_2) {
				dlog.out("%s: expired %s\n", __cname
					, rr->chars());
			}
			delete node;
			n++;
			continue;
		}

		node->set_content(NULL);
		delete node;

		_rr.push_tail(rr);
	}

	return n;
}

/**
 * `REMAINING_TTL()` will return the lifetime left on unexpired record `rr`
 * at time `now`, rounded up to the next second.
 */
int32_t Zone::REMAINING_TTL(RR* rr, const double now)
{
	double left = ceil(rr->expiry() - now);

	if (left < 1) {
		return 1;
	}
	if (left > (double) rr->_ttl) {
		return rr->_ttl;
	}

	return (int32_t) left;
}

/**
 * `get_records()` will purge expired records and then append a copy of each
 * record with type `type` to `out`.
 *
 * TTL on copy of non-hint record is set to the remaining lifetime at time
 * `now`.
 *
 * It will return number of records appended.
 */
int Zone::get_records(const uint16_t type, List* out, const double now)
{
	int n = 0;
	RR* rr = NULL;
	RR* cp = NULL;

	purge(now);

	for (int x = 0; x < _rr.size(); x++) {
		rr = (RR*) _rr.at(x);

		if (rr->_type != type) {
			continue;
		}

		cp = RR::COPY(rr);
		if (cp->_ttl >= 0) {
			cp->_ttl = REMAINING_TTL(rr, now);
			cp->_fetched_at = now;
		}

		out->push_tail(cp);
		n++;
	}

	return n;
}

/**
 * `get_name()` will set `out` to fully qualified name of this zone, without
 * trailing dot.
 */
void Zone::get_name(Buffer* out)
{
	Zone* z = this;

	out->reset();

	while (z && z->_parent) {
		if (out->len() > 0) {
			out->append_raw(".", 1);
		}
		out->append_raw(z->_label.v(), z->_label.len());
		z = z->_parent;
	}
}

void Zone::dump(const double now)
{
	Buffer name;
	RR* rr = NULL;
	const char* value = NULL;

	get_name(&name);

	dlog.writef("[%s.]\n", name.is_empty() ? "" : name.v());

	for (int x = 0; x < _rr.size(); x++) {
		rr = (RR*) _rr.at(x);
		value = rr->_value.is_empty() ? "." : rr->_value.v();

		if (rr->_ttl < 0) {
			dlog.writef("    %-6s %s  (hint)\n"
				, RRType::GET_NAME(rr->_type), value);
		} else {
			dlog.writef("    %-6s %s  (%.0fs)\n"
				, RRType::GET_NAME(rr->_type), value
				, rr->expiry() - now);
		}
	}

	for (int x = 0; x < _child.size(); x++) {
		((Zone*) _child.at(x))->dump(now);
	}
}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
