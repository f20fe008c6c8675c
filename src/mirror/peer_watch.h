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

#include <photon/thread/thread.h>
#include "cancellation.h"

// Watches the client side of a connection while an operation runs and
// cancels the operation once the client hangs up. Used only when no request
// body is pending on the socket.
class PeerWatch {
public:
    PeerWatch(int fd, Cancellation *cancel);
    // stops watching and joins the watcher thread
    ~PeerWatch();

    bool peer_gone() const {
        return m_gone;
    }

private:
    void watch();

    int m_fd;
    Cancellation *m_cancel;
    photon::thread *m_th = nullptr;
    photon::join_handle *m_jh = nullptr;
    bool m_running = false;
    bool m_stop = false;
    bool m_gone = false;
};
