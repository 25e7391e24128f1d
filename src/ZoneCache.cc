//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <ctype.h>
#include <stdlib.h>
#include <strings.h>
#include "ZoneCache.hh"

namespace recursed {

const char* ZoneCache::__cname = "ZoneCache";

//
// Built-in root hints, as triplet of type, owner name, and value.
// Root zone is an empty name.
//
const char* ZoneCache::ROOT_HINTS[] = {
	"NS",	"",			"a.root-servers.net"
,	"NS",	"",			"b.root-servers.net"
,	"NS",	"",			"c.root-servers.net"
,	"NS",	"",			"d.root-servers.net"
,	"NS",	"",			"e.root-servers.net"
,	"NS",	"",			"f.root-servers.net"
,	"NS",	"",			"g.root-servers.net"
,	"NS",	"",			"h.root-servers.net"
,	"NS",	"",			"i.root-servers.net"
,	"NS",	"",			"j.root-servers.net"
,	"NS",	"",			"k.root-servers.net"
,	"NS",	"",			"l.root-servers.net"
,	"NS",	"",			"m.root-servers.net"
,	"NS",	"root-servers.net",	"a.root-servers.net"
,	"NS",	"root-servers.net",	"b.root-servers.net"
,	"NS",	"root-servers.net",	"c.root-servers.net"
,	"NS",	"root-servers.net",	"d.root-servers.net"
,	"NS",	"root-servers.net",	"e.root-servers.net"
,	"NS",	"root-servers.net",	"f.root-servers.net"
,	"NS",	"root-servers.net",	"g.root-servers.net"
,	"NS",	"root-servers.net",	"h.root-servers.net"
,	"NS",	"root-servers.net",	"i.root-servers.net"
,	"NS",	"root-servers.net",	"j.root-servers.net"
,	"NS",	"root-servers.net",	"k.root-servers.net"
,	"NS",	"root-servers.net",	"l.root-servers.net"
,	"NS",	"root-servers.net",	"m.root-servers.net"
,	"A",	"a.root-servers.net",	"198.41.0.4"
,	"A",	"b.root-servers.net",	"170.247.170.2"
,	"A",	"c.root-servers.net",	"192.33.4.12"
,	"A",	"d.root-servers.net",	"199.7.91.13"
,	"A",	"e.root-servers.net",	"192.203.230.10"
,	"A",	"f.root-servers.net",	"192.5.5.241"
,	"A",	"g.root-servers.net",	"192.112.36.4"
,	"A",	"h.root-servers.net",	"198.97.190.53"
,	"A",	"i.root-servers.net",	"192.36.148.17"
,	"A",	"j.root-servers.net",	"192.58.128.30"
,	"A",	"k.root-servers.net",	"193.0.14.129"
,	"A",	"l.root-servers.net",	"199.7.83.42"
,	"A",	"m.root-servers.net",	"202.12.27.33"
,	NULL
};

ZoneCache::ZoneCache()
: Locker()
, _root()
, _n_rr(0)
{}

ZoneCache::~ZoneCache()
{}

//
// `walk()` will find the deepest zone for `len` bytes of normalized
// `name`, by matching each label from the right-most one.
//
int ZoneCache::walk(const char* name, const int len, Zone** zone
			, int* n_labels, int* n_matched)
{
	int end = len;
	int start = 0;
	int labels = 0;
	int matched = 0;
	Zone* z = &_root;
	Zone* child = NULL;

	while (end > 0) {
		start = end - 1;
		while (start >= 0 && name[start] != '.') {
			start--;
		}

		labels++;

		if (z) {
			child = z->get_child(&name[start + 1]
						, end - start - 1);
			if (child) {
				z = child;
				matched++;
			} else {
				*zone = z;
				z = NULL;
			}
		}

		end = start;
	}

	if (z) {
		*zone = z;
	}
	if (n_labels) {
		*n_labels = labels;
	}
	if (n_matched) {
		*n_matched = matched;
	}

	return 0;
}

/**
 * @method		: ZoneCache::get_zone
 * @param		:
 *	> name		: domain name.
 *	> zone		: return value, the deepest zone in cache for `name`.
 *	> n_labels	: return value, number of labels in `name`.
 *	> n_matched	: return value, number of labels, counted from the
 *			  right-most label, that exist in cache.
 * @return		:
 *	< 0		: success.
 * @desc		: walk the zone tree from root to find the closest
 * zone that hold `name`. The zone is an exact match if `n_labels` equal to
 * `n_matched`.
 */
int ZoneCache::get_zone(const char* name, Zone** zone, int* n_labels
			, int* n_matched)
{
	Buffer norm;

	RR::NORMALIZE_NAME(&norm, name);

	lock();
	int s = walk(norm.is_empty() ? "" : norm.v(), (int) norm.len()
			, zone, n_labels, n_matched);
	unlock();

	return s;
}

/**
 * `get_records()` will append copy of all unexpired records with type
 * `type` in `zone` to `out`. Expired records found in zone are removed.
 * It will return number of records appended.
 */
int ZoneCache::get_records(Zone* zone, const uint16_t type, List* out)
{
	int n = 0;

	if (!zone) {
		return 0;
	}

	lock();
	n = zone->get_records(type, out, time_now());
	unlock();

	return n;
}

/**
 * `lookup()` will append copy of records with `type` owned by `name` to
 * `out`, only if `name` exist in cache.
 */
int ZoneCache::lookup(const char* name, const uint16_t type, List* out)
{
	Zone* zone = NULL;
	int n_labels = 0;
	int n_matched = 0;

	get_zone(name, &zone, &n_labels, &n_matched);

	if (n_labels != n_matched) {
		return 0;
	}

	return get_records(zone, type, out);
}

Zone* ZoneCache::get_or_create_zone(Buffer* name)
{
	int end = (int) name->len();
	int start = 0;
	Zone* z = &_root;
	Zone* child = NULL;
	const char* v = end > 0 ? name->v() : "";

	while (end > 0) {
		start = end - 1;
		while (start >= 0 && v[start] != '.') {
			start--;
		}

		child = z->get_child(&v[start + 1], end - start - 1);
		if (!child) {
			child = z->add_child(&v[start + 1], end - start - 1);
		}

		z = child;
		end = start;
	}

	return z;
}

/**
 * `insert_copy()` will store a copy of record `rr` in zone of its owner
 * name, creating the missing zones.
 *
 * Only record with cacheable type is stored; the same record inserted twice
 * is stored twice.
 *
 * It will return 1 if record is stored or 0 if record is not cacheable.
 */
int ZoneCache::insert_copy(RR* rr)
{
	Zone* zone = NULL;

	if (!rr || !RRType::IS_CACHEABLE(rr->_type)) {
		return 0;
	}

	RR* cp = RR::COPY(rr);

	lock();

	zone = get_or_create_zone(&cp->_name);
	zone->add(cp);
	_n_rr++;

	unlock();

	if (DBG_LVL_IS_2) {
		dlog.out("%s: insert %s\n", __cname, cp->chars());
	}

	return 1;
}

//
// `insert()` will insert copy of each record in `rrs`, and return number
// of records stored.
//
int ZoneCache::insert(List* rrs)
{
	int n = 0;

	if (!rrs) {
		return 0;
	}

	for (int x = 0; x < rrs->size(); x++) {
		n += insert_copy((RR*) rrs->at(x));
	}

	return n;
}

/**
 * `load_default_hints()` will load built-in root hints into cache. Hint
 * records never expire.
 */
int ZoneCache::load_default_hints()
{
	int n = 0;
	RR rr;

	for (int x = 0; ROOT_HINTS[x]; x += 3) {
		rr._type = (uint16_t) RRType::GET_VALUE(ROOT_HINTS[x]);
		rr._ttl = -1;
		rr.set_name(ROOT_HINTS[x + 1]);
		rr.set_value(ROOT_HINTS[x + 2]);

		n += insert_copy(&rr);
	}

	dlog.out("%s: %d default root hints loaded.\n", __cname, n);

	return 0;
}

/**
 * @method	: ZoneCache::load_hints
 * @param	:
 *	> fhints : path to root hints file.
 * @return	:
 *	< 0	: success.
 *	< -1	: fail to open the file or no hints found in file.
 * @desc	: load root hints from file in zone-file form,
 *
 *	<name> [ttl] [class] <type> <value>
 *
 * Line started with ';' is a comment. Only NS, A, and AAAA records are
 * loaded. TTL in file is ignored; hints never expire.
 */
int ZoneCache::load_hints(const char* fhints)
{
	int s = 0;
	int n = 0;
	int y = 0;
	int type = 0;
	List* row = NULL;
	Buffer* c = NULL;
	RR rr;

	if (!fhints || !fhints[0]) {
		return -1;
	}

	dlog.out("%s: loading hints file '%s'\n", __cname, fhints);

	SSVReader reader(';');

	s = reader.load(fhints);
	if (s != 0) {
		dlog.er("%s: cannot load hints file '%s'!\n", __cname
			, fhints);
		return -1;
	}

	for (int x = 0; x < reader._rows->size(); x++) {
		row = (List*) reader._rows->at(x);
		if (row->size() < 3) {
			continue;
		}

		type = -1;
		for (y = 1; y < row->size() - 1; y++) {
			c = (Buffer*) row->at(y);

			if (isdigit((unsigned char) c->char_at(0))) {
				continue;
			}
			if (c->like_raw("IN") == 0) {
				continue;
			}

			type = RRType::GET_VALUE(c->chars());
			break;
		}

		if (type != RR_T_NS && type != RR_T_A && type != RR_T_AAAA) {
			continue;
		}

		rr._type = (uint16_t) type;
		rr._ttl = -1;
		rr.set_name(row->at(0)->chars());
		rr.set_value(row->at(y + 1)->chars());

		n += insert_copy(&rr);
	}

	if (n <= 0) {
		dlog.er("%s: no hints found in '%s'!\n", __cname, fhints);
		return -1;
	}

	dlog.out("%s: %d root hints loaded.\n", __cname, n);

	return 0;
}

void ZoneCache::dump()
{
	lock();

	dlog.writef("\nZoneCache::dump >> TREE (%ld records inserted)\n"
		, _n_rr);
	_root.dump(time_now());

	unlock();
}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
