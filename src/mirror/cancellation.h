/*
   Copyright The Overlaybd Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
#pragma once

#include <errno.h>
#include <photon/thread/thread.h>

// Cancellation context of one logical operation, bound to the photon thread
// that runs it. cancel() from another thread interrupts whatever that thread
// is blocked on (socket I/O or a backoff sleep).
class Cancellation {
public:
    Cancellation() : m_owner(photon::CURRENT) {}

    bool cancelled() const {
        return m_cancelled;
    }

    void cancel() {
        if (m_cancelled)
            return;
        m_cancelled = true;
        if (m_owner && m_owner != photon::CURRENT)
            photon::thread_interrupt(m_owner, ECANCELED);
    }

    // 0 after the full delay, -1 with ECANCELED when cancelled
    int sleep(uint64_t us) {
        if (m_cancelled) {
            errno = ECANCELED;
            return -1;
        }
        photon::thread_usleep(us);
        if (m_cancelled) {
            errno = ECANCELED;
            return -1;
        }
        return 0;
    }

private:
    photon::thread *m_owner;
    bool m_cancelled = false;
};
