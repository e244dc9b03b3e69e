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

#pragma once

#include <QtCore>

#include <functional>

#include <termios.h>

/**
 * The terminal we draw on: raw mode, alternate screen, geometry and the
 * one-time capability probes. Reply parsing is kept in static functions
 * so it can be exercised without a tty.
 */
class QTermTerminal : public QObject {
    Q_OBJECT;

    public:
        enum ProbeResult {
            ProbeSupported,
            ProbeUnsupported,
            ProbeIncomplete
        };
        Q_ENUM( ProbeResult );

        /* What the environment says before we ask the terminal */
        struct Hints {
            bool kitty = false;
            bool tmux  = false;
        };

        QTermTerminal( int inFd, int outFd, QObject *parent = nullptr );
        ~QTermTerminal();

        bool isTty() const;

        bool enterRawMode();
        void leaveRawMode();

        void enterAlternateScreen();
        void leaveAlternateScreen();

        void setCursorVisible( bool );
        void clearScreen();

        /* Size in cells, 80x24 when unknown */
        QSize size() const;

        /* Size of one cell in pixels: ioctl first, CSI 16 t second; invalid when unknown */
        QSize cellPixelSize( int timeoutMs = 200 );

        /* Ask the terminal whether it speaks the kitty graphics protocol */
        bool probeKitty( int timeoutMs );

        /* Bytes typed so far, including any that arrived with a probe reply */
        QByteArray readInput();

        /* Output device, owned by us */
        QIODevice *output() const;

        int inputFd() const;

        static Hints environmentHints( const QProcessEnvironment& env );

        /* How long to wait for the probe reply: 0 means do not probe */
        static int probeTimeout( const Hints& hints );

        static QByteArray kittyQuery();
        static ProbeResult parseKittyReply( const QByteArray& reply );

        /* Reply to CSI 16 t: ESC [ 6 ; height ; width t */
        static QSize parseCellSizeReply( const QByteArray& reply );

    private:
        void writeRaw( const QByteArray& bytes );

        /* Read until @done says the reply is complete, or time runs out */
        QByteArray readReply( int timeoutMs, std::function<bool( const QByteArray& )> done );

        int mInFd;
        int mOutFd;

        QFile *mOut;

        bool mRaw;
        bool mAltScreen;
        struct termios mSaved;

        QByteArray mPending;
};
