//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <signal.h>
#include <stdio.h>
#include <string.h>
#include "Recursed.hh"

using namespace recursed;

volatile sig_atomic_t	_SIG_lock_	= 0;
static int		_got_signal_	= 0;
static Recursed		R;

static void recursed_interrupted(int sig_num)
{
	switch (sig_num) {
	case SIGUSR1:
		/* send interrupt to select() */
		break;
	case SIGTERM:
	case SIGINT:
	case SIGQUIT:
		if (_SIG_lock_) {
			::raise(sig_num);
		}
		_SIG_lock_	= 1;
		_got_signal_	= sig_num;
		_running	= 0;
		_SIG_lock_	= 0;
		break;
	}
}

static void recursed_set_signal_handle()
{
	struct sigaction sig_new;

	memset(&sig_new, 0, sizeof(struct sigaction));
	sig_new.sa_handler = recursed_interrupted;
	sigemptyset(&sig_new.sa_mask);
	sig_new.sa_flags = 0;

	sigaction(SIGINT, &sig_new, 0);
	sigaction(SIGQUIT, &sig_new, 0);
	sigaction(SIGTERM, &sig_new, 0);
	sigaction(SIGUSR1, &sig_new, 0);
}

int main(int argc, char *argv[])
{
	int s = -1;

	recursed_set_signal_handle();

	if (argc == 1) {
		s = R.init(NULL);
	} else if (argc == 2) {
		s = R.init(argv[1]);
	} else {
		dlog.er("\n Usage: recursed <recursed-config>\n ");
	}
	if (s != 0) {
		goto err;
	}

	s = R.run();

	if (_got_signal_ && DBG_LVL_IS_1) {
		dlog.er("recursed: got signal %d\n", _got_signal_);
	}
err:
	if (s) {
		perror(NULL);
	}
	R.exit();

	return s;
}
// vi: ts=8 sw=8 tw=78:
