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

#include <qtermdoc/QTermTerminal.hpp>
#include <qtermdoc/QTermView.hpp>

#include <cstdio>

namespace TerminalTests {
    inline bool testKittyReply() {
        printf( "  testKittyReply... " );

        if ( QTermTerminal::parseKittyReply( "\x1b_Gi=31;OK\x1b\\\x1b[?62;c" ) != QTermTerminal::ProbeSupported ) {
            printf( "FAILED: OK reply not accepted\n" );
            return false;
        }

        if ( QTermTerminal::parseKittyReply( "\x1b_Gi=31;ENOTSUPPORTED:no\x1b\\" ) != QTermTerminal::ProbeUnsupported ) {
            printf( "FAILED: error reply taken as support\n" );
            return false;
        }

        /* Only device attributes: the terminal ignored the graphics query */
        if ( QTermTerminal::parseKittyReply( "\x1b[?64;1;2;6;22c" ) != QTermTerminal::ProbeUnsupported ) {
            printf( "FAILED: bare device attributes\n" );
            return false;
        }

        if ( QTermTerminal::parseKittyReply( "\x1b_Gi=31;O" ) != QTermTerminal::ProbeIncomplete ) {
            printf( "FAILED: half a reply is not an answer\n" );
            return false;
        }

        if ( QTermTerminal::parseKittyReply( "" ) != QTermTerminal::ProbeIncomplete ) {
            printf( "FAILED: empty reply\n" );
            return false;
        }

        const QByteArray query = QTermTerminal::kittyQuery();

        if ( not query.startsWith( "\x1b_Gi=31," ) or not query.contains( "a=q" ) or not query.endsWith( "\x1b\\" ) ) {
            printf( "FAILED: malformed query\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testCellSizeReply() {
        printf( "  testCellSizeReply... " );

        if ( QTermTerminal::parseCellSizeReply( "\x1b[6;20;10t" ) != QSize( 10, 20 ) ) {
            printf( "FAILED: width and height swapped\n" );
            return false;
        }

        if ( QTermTerminal::parseCellSizeReply( "jk\x1b[6;18;9tq" ) != QSize( 9, 18 ) ) {
            printf( "FAILED: reply between key presses\n" );
            return false;
        }

        if ( QTermTerminal::parseCellSizeReply( "\x1b[6;0;0t" ).isValid() or QTermTerminal::parseCellSizeReply( "\x1b[6;20" ).isValid() ) {
            printf( "FAILED: bogus reply accepted\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testEnvironmentHints() {
        printf( "  testEnvironmentHints... " );

        QProcessEnvironment env;

        if ( QTermTerminal::probeTimeout( QTermTerminal::environmentHints( env ) ) != 0 ) {
            printf( "FAILED: unknown terminals are not probed\n" );
            return false;
        }

        env.insert( "TMUX", "/tmp/tmux-1000/default,1,0" );

        QTermTerminal::Hints hints = QTermTerminal::environmentHints( env );

        if ( not hints.tmux or hints.kitty or (QTermTerminal::probeTimeout( hints ) != 300) ) {
            printf( "FAILED: tmux hints\n" );
            return false;
        }

        env.insert( "TERM", "xterm-kitty" );
        hints = QTermTerminal::environmentHints( env );

        if ( not hints.kitty or (QTermTerminal::probeTimeout( hints ) != 1500) ) {
            printf( "FAILED: kitty hints\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testKeyParsing() {
        printf( "  testKeyParsing... " );

        QByteArray input( "jl+-0nq" );

        QList<QTermView::Action> actions = QTermView::parseKeys( input );

        const QList<QTermView::Action> expected = {
            QTermView::PanDown, QTermView::PanRight, QTermView::ZoomIn, QTermView::ZoomOut,
            QTermView::ResetView, QTermView::NextPage, QTermView::Quit
        };

        if ( (actions != expected) or input.size() ) {
            printf( "FAILED: plain keys\n" );
            return false;
        }

        input   = QByteArray( "\x1b[A\x1bOB\x1b[6~\x1b[5~x" );
        actions = QTermView::parseKeys( input );

        if ( actions != QList<QTermView::Action>( { QTermView::PanUp, QTermView::PanDown, QTermView::PageDown, QTermView::PageUp } ) ) {
            printf( "FAILED: escape sequences\n" );
            return false;
        }

        /* A sequence split across reads waits for the rest */
        input   = QByteArray( "n\x1b[" );
        actions = QTermView::parseKeys( input );

        if ( (actions != QList<QTermView::Action>( { QTermView::NextPage } ) ) or (input != "\x1b[") ) {
            printf( "FAILED: partial sequence consumed\n" );
            return false;
        }

        input  += "C";
        actions = QTermView::parseKeys( input );

        if ( (actions != QList<QTermView::Action>( { QTermView::PanRight } ) ) or input.size() ) {
            printf( "FAILED: completed sequence not recognised\n" );
            return false;
        }

        input   = QByteArray( "\x03" );
        actions = QTermView::parseKeys( input );

        if ( actions != QList<QTermView::Action>( { QTermView::Quit } ) ) {
            printf( "FAILED: Ctrl-C must quit\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool runAllTests() {
        printf( "\nTerminal\n" );

        bool allPass = true;

        allPass &= testKittyReply();
        allPass &= testCellSizeReply();
        allPass &= testEnvironmentHints();
        allPass &= testKeyParsing();

        return allPass;
    }
}
