//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include "common.hh"

namespace recursed {

Dlogger		dlog;
int		_dbg		= 0;
uint8_t		_running	= 0;

/**
 * `time_now()` will return current wall-clock time in seconds, with
 * microsecond fraction.
 */
double time_now()
{
	struct timeval tv;

	gettimeofday(&tv, NULL);

	return (double) tv.tv_sec + ((double) tv.tv_usec / 1000000.0);
}

//
// `list_clear()` will remove and release all nodes, including their
// content, from `list`.
//
void list_clear(List* list)
{
	BNode* node = NULL;

	if (!list) {
		return;
	}

	while (list->size() > 0) {
		node = list->node_pop_head();
		delete node;
	}
}

//
// `list_move()` will move each content of `src` to the tail of `dst`,
// leaving `src` empty. It will return number of objects moved.
//
int list_move(List* dst, List* src)
{
	int n = 0;
	BNode* node = NULL;
	Object* o = NULL;

	if (!dst || !src) {
		return 0;
	}

	while (src->size() > 0) {
		node = src->node_pop_head();
		o = node->get_content();
		node->set_content(NULL);
		delete node;

		dst->push_tail(o);
		n++;
	}

	return n;
}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
