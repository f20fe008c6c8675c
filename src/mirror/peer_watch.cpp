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
#include "peer_watch.h"

#include <errno.h>
#include <sys/socket.h>
#include <photon/common/alog.h>
#include <photon/common/utility.h>
#include <photon/io/fd-events.h>

PeerWatch::PeerWatch(int fd, Cancellation *cancel) : m_fd(fd), m_cancel(cancel) {
    if (m_fd < 0 || m_cancel == nullptr)
        return;
    m_running = true;
    m_th = photon::thread_create11(&PeerWatch::watch, this);
    m_jh = photon::thread_enable_join(m_th);
}

PeerWatch::~PeerWatch() {
    if (m_jh == nullptr)
        return;
    m_stop = true;
    if (m_running)
        photon::thread_interrupt(m_th, ECANCELED);
    photon::thread_join(m_jh);
}

void PeerWatch::watch() {
    DEFER(m_running = false);
    while (!m_stop) {
        auto ret = photon::wait_for_fd_readable(m_fd, -1UL);
        if (m_stop)
            return;
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            LOG_WARN("stop watching client fd `, errno=`", m_fd, errno);
            return;
        }
        char c;
        auto n = ::recv(m_fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n > 0) {
            // next pipelined request, the connection is alive
            return;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            continue;
        LOG_INFO("client on fd ` hung up, cancel its operation", m_fd);
        m_gone = true;
        m_cancel->cancel();
        return;
    }
}
