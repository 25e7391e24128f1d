//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_ZONE_HH
#define _RECURSED_ZONE_HH 1

#include "RR.hh"

namespace recursed {

/**
 * @class	: Zone
 * @attr	:
 *	- _label	: one label of domain name, empty for root.
 *	- _parent	: pointer to parent zone, NULL for root.
 *	- _child	: list of sub-zone, owned by this zone.
 *	- _rr		: list of records owned by this zone, all of them has
 *			  the same owner name as this zone.
 * @desc	: one node in tree of cached domain names.
 *
 * Zone never expire by itself. Expired records is removed when the records
 * is read.
 */
class Zone : public Object {
public:
	Zone(Zone* parent = NULL, const char* label = NULL);
	~Zone();

	const char* chars();

	Zone* get_child(const char* label, const int len);
	Zone* add_child(const char* label, const int len);

	void add(RR* rr);
	int purge(const double now);
	int get_records(const uint16_t type, List* out, const double now);

	void get_name(Buffer* out);
	void dump(const double now);

	static int32_t REMAINING_TTL(RR* rr, const double now);

	Buffer	_label;
	Zone*	_parent;
	List	_child;
	List	_rr;

	static const char* __cname;
private:
	Zone(const Zone&);
	void operator=(const Zone&);
};

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
