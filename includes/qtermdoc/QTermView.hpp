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

#include <qtermdoc/QTermRenderer.hpp>
#include <qtermdoc/QTermSink.hpp>
#include <qtermdoc/QTermTerminal.hpp>

/**
 * The interactive loop: reads keys from the terminal, turns them into
 * renderer actions and asks for a frame afterwards. The last terminal row
 * is a status line; everything above it is the frame.
 */
class QTermView : public QObject {
    Q_OBJECT;

    public:
        enum Action {
            NoAction,
            Quit,
            ZoomIn,
            ZoomOut,
            ResetView,
            PanLeft,
            PanRight,
            PanUp,
            PanDown,
            PageUp,
            PageDown,
            NextPage,
            PreviousPage,
            FirstPage,
            LastPage,
            ToggleMode,
            CycleTextMode,
            Redraw
        };
        Q_ENUM( Action );

        QTermView( QTermTerminal *term, QTermRenderer *renderer, QObject *parent = nullptr );
        ~QTermView();

        /* Use the cell fallback even if the terminal speaks kitty */
        void setForceBlocks( bool );

        /* Enter the alternate screen, pick the sink, start reading keys */
        bool start();
        void stop();

        QTermSink *sink() const;

        /* Actions of the complete key sequences in @buffer; incomplete ones stay there */
        static QList<Action> parseKeys( QByteArray& buffer );

        /* Text of the status line */
        static QString statusText( QTermRenderer *renderer, QTermSink::Kind kind );

    public Q_SLOTS:
        void handleAction( QTermView::Action action );
        void redraw();

    private Q_SLOTS:
        void readInput();
        void checkSize();

    private:
        void updateFrameGeometry();
        void drawStatus();

        QTermTerminal *mTerm;
        QTermRenderer *mRenderer;

        QScopedPointer<QTermSink> mSink;

        QSocketNotifier *mNotifier;
        QTimer *mResizeTimer;

        QByteArray mInput;
        QSize mTermSize;

        bool mForceBlocks;
        bool mRunning;

    Q_SIGNALS:
        void finished();
};
