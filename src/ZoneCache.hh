//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_ZONE_CACHE_HH
#define _RECURSED_ZONE_CACHE_HH 1

#include "Locker.hh"
#include "SSVReader.hh"
#include "Zone.hh"

using vos::Locker;
using vos::SSVReader;

namespace recursed {

/**
 * @class	: ZoneCache
 * @attr	:
 *	- _root		: root of zone tree.
 *	- _n_rr		: number of records inserted since created.
 * @desc	: cache of DNS records, organized by domain name labels from
 * the right-most label.
 *
 * All records inserted into cache are copied; all records returned from
 * cache are copies owned by the caller.
 */
class ZoneCache : public Locker {
public:
	ZoneCache();
	~ZoneCache();

	int get_zone(const char* name, Zone** zone, int* n_labels
			, int* n_matched);
	int get_records(Zone* zone, const uint16_t type, List* out);
	int lookup(const char* name, const uint16_t type, List* out);

	int insert_copy(RR* rr);
	int insert(List* rrs);

	int load_default_hints();
	int load_hints(const char* fhints);

	void dump();

	Zone	_root;
	long	_n_rr;

	static const char* ROOT_HINTS[];
	static const char* __cname;
private:
	ZoneCache(const ZoneCache&);
	void operator=(const ZoneCache&);

	Zone* get_or_create_zone(Buffer* name);
	int walk(const char* name, const int len, Zone** zone
			, int* n_labels, int* n_matched);
};

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
