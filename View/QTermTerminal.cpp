/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#include <qtermdoc/QTermTerminal.hpp>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>

/* Image id used only by the capability query */
static const char *KittyProbeId = "31";

static bool hasDeviceAttributes( const QByteArray& reply ) {
    static const QRegularExpression da1( "\x1b\\[\\?[0-9;]*c" );

    return da1.match( QString::fromLatin1( reply ) ).hasMatch();
}


QTermTerminal::QTermTerminal( int inFd, int outFd, QObject *parent ) : QObject( parent ) {
    mInFd      = inFd;
    mOutFd     = outFd;
    mRaw       = false;
    mAltScreen = false;

    mOut = new QFile();

    if ( not mOut->open( outFd, QIODevice::WriteOnly | QIODevice::Unbuffered, QFileDevice::DontCloseHandle ) ) {
        qWarning() << "Unable to open the terminal for writing:" << mOut->errorString();
    }
}


QTermTerminal::~QTermTerminal() {
    if ( mAltScreen ) {
        setCursorVisible( true );
        leaveAlternateScreen();
    }

    leaveRawMode();

    mOut->close();
    delete mOut;
}


bool QTermTerminal::isTty() const {
    return isatty( mInFd ) and isatty( mOutFd );
}


bool QTermTerminal::enterRawMode() {
    if ( mRaw ) {
        return true;
    }

    if ( tcgetattr( mInFd, &mSaved ) != 0 ) {
        qWarning() << "tcgetattr failed:" << strerror( errno );
        return false;
    }

    struct termios raw = mSaved;

    cfmakeraw( &raw );

    /** Non-blocking reads: the event loop tells us when input is there */
    raw.c_cc[ VMIN ]  = 0;
    raw.c_cc[ VTIME ] = 0;

    if ( tcsetattr( mInFd, TCSAFLUSH, &raw ) != 0 ) {
        qWarning() << "tcsetattr failed:" << strerror( errno );
        return false;
    }

    mRaw = true;

    return true;
}


void QTermTerminal::leaveRawMode() {
    if ( not mRaw ) {
        return;
    }

    if ( tcsetattr( mInFd, TCSAFLUSH, &mSaved ) != 0 ) {
        qWarning() << "Unable to restore the terminal:" << strerror( errno );
    }

    mRaw = false;
}


void QTermTerminal::enterAlternateScreen() {
    if ( mAltScreen ) {
        return;
    }

    writeRaw( "\x1b[?1049h\x1b[2J\x1b[H" );
    mAltScreen = true;
}


void QTermTerminal::leaveAlternateScreen() {
    if ( not mAltScreen ) {
        return;
    }

    writeRaw( "\x1b[0m\x1b[?1049l" );
    mAltScreen = false;
}


void QTermTerminal::setCursorVisible( bool yes ) {
    writeRaw( yes ? "\x1b[?25h" : "\x1b[?25l" );
}


void QTermTerminal::clearScreen() {
    writeRaw( "\x1b[0m\x1b[2J\x1b[H" );
}


QSize QTermTerminal::size() const {
    struct winsize ws;

    if ( (ioctl( mOutFd, TIOCGWINSZ, &ws ) == 0) and ws.ws_col and ws.ws_row ) {
        return QSize( ws.ws_col, ws.ws_row );
    }

    return QSize( 80, 24 );
}


QSize QTermTerminal::cellPixelSize( int timeoutMs ) {
    struct winsize ws;

    if ( (ioctl( mOutFd, TIOCGWINSZ, &ws ) == 0) and ws.ws_col and ws.ws_row and ws.ws_xpixel and ws.ws_ypixel ) {
        return QSize( ws.ws_xpixel / ws.ws_col, ws.ws_ypixel / ws.ws_row );
    }

    if ( mRaw and (timeoutMs > 0) ) {
        writeRaw( "\x1b[16t" );

        QByteArray reply = readReply(
            timeoutMs, [] ( const QByteArray& buf ) {
                return parseCellSizeReply( buf ).isValid();
            }
        );

        QSize cell = parseCellSizeReply( reply );

        if ( cell.isValid() ) {
            return cell;
        }
    }

    qDebug() << "Cell size unknown";

    return QSize();
}


bool QTermTerminal::probeKitty( int timeoutMs ) {
    if ( timeoutMs <= 0 or not mRaw ) {
        return false;
    }

    /** The DA1 query guarantees an answer even from terminals that ignore the first one */
    writeRaw( kittyQuery() + "\x1b[c" );

    QByteArray reply = readReply(
        timeoutMs, [] ( const QByteArray& buf ) {
            return parseKittyReply( buf ) != ProbeIncomplete;
        }
    );

    const ProbeResult result = parseKittyReply( reply );

    qDebug() << "Kitty graphics probe:" << result;

    return result == ProbeSupported;
}


QByteArray QTermTerminal::readInput() {
    QByteArray input = mPending;

    mPending.clear();

    char buf[ 1024 ];

    while ( true ) {
        const ssize_t got = ::read( mInFd, buf, sizeof(buf) );

        if ( got > 0 ) {
            input.append( buf, (int)got );
            continue;
        }

        if ( (got < 0) and (errno == EINTR) ) {
            continue;
        }

        break;
    }

    return input;
}


QIODevice *QTermTerminal::output() const {
    return mOut;
}


int QTermTerminal::inputFd() const {
    return mInFd;
}


QTermTerminal::Hints QTermTerminal::environmentHints( const QProcessEnvironment& env ) {
    Hints hints;

    hints.kitty = env.contains( "KITTY_WINDOW_ID" ) or (env.value( "TERM" ) == "xterm-kitty");
    hints.tmux  = env.contains( "TMUX" );

    return hints;
}


int QTermTerminal::probeTimeout( const Hints& hints ) {
    if ( hints.kitty ) {
        return 1500;
    }

    /** Inside tmux the outer terminal is unknown: ask, but do not stall */
    if ( hints.tmux ) {
        return 300;
    }

    return 0;
}


QByteArray QTermTerminal::kittyQuery() {
    return QByteArray( "\x1b_Gi=" ) + KittyProbeId + ",s=1,v=1,a=q,t=d,f=24;AAAA\x1b\\";
}


QTermTerminal::ProbeResult QTermTerminal::parseKittyReply( const QByteArray& reply ) {
    const QByteArray prefix = QByteArray( "\x1b_Gi=" ) + KittyProbeId + ";";
    const int        start  = reply.indexOf( prefix );

    if ( start >= 0 ) {
        const int end = reply.indexOf( "\x1b\\", start );

        if ( end < 0 ) {
            return ProbeIncomplete;
        }

        const QByteArray status = reply.mid( start + prefix.size(), end - start - prefix.size() );

        return (status == "OK" ? ProbeSupported : ProbeUnsupported);
    }

    /** Device attributes came back and no graphics reply preceded them */
    if ( hasDeviceAttributes( reply ) ) {
        return ProbeUnsupported;
    }

    return ProbeIncomplete;
}


QSize QTermTerminal::parseCellSizeReply( const QByteArray& reply ) {
    static const QRegularExpression re( "\x1b\\[6;(\\d+);(\\d+)t" );

    QRegularExpressionMatch match = re.match( QString::fromLatin1( reply ) );

    if ( not match.hasMatch() ) {
        return QSize();
    }

    const int h = match.captured( 1 ).toInt();
    const int w = match.captured( 2 ).toInt();

    if ( (w <= 0) or (h <= 0) ) {
        return QSize();
    }

    return QSize( w, h );
}


void QTermTerminal::writeRaw( const QByteArray& bytes ) {
    if ( mOut->write( bytes ) != bytes.size() ) {
        qWarning() << "Short write to the terminal:" << mOut->errorString();
    }

    mOut->flush();
}


QByteArray QTermTerminal::readReply( int timeoutMs, std::function<bool( const QByteArray& )> done ) {
    QByteArray    reply;
    QElapsedTimer timer;

    timer.start();

    while ( not done( reply ) ) {
        const int left = timeoutMs - (int)timer.elapsed();

        if ( left <= 0 ) {
            break;
        }

        struct pollfd pfd;
        pfd.fd      = mInFd;
        pfd.events  = POLLIN;
        pfd.revents = 0;

        const int ready = ::poll( &pfd, 1, left );

        if ( ready < 0 and errno == EINTR ) {
            continue;
        }

        if ( ready <= 0 ) {
            break;
        }

        char          buf[ 256 ];
        const ssize_t got = ::read( mInFd, buf, sizeof(buf) );

        if ( got <= 0 ) {
            break;
        }

        reply.append( buf, (int)got );
    }

    /** Keys typed while we waited are still input */
    QByteArray rest = reply;

    static const QRegularExpression replies( "\x1b_G[^\x1b]*\x1b\\\\|\x1b\\[\\?[0-9;]*c|\x1b\\[6;\\d+;\\d+t" );
    QString                         text = QString::fromLatin1( rest );

    text.remove( replies );
    mPending += text.toLatin1();

    return reply;
}
