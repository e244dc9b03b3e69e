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
#include <QtGui/QImage>

#include <qtermdoc/QTermViewport.hpp>

/**
 * Turns pixels and placement geometry into terminal output.
 * The active variant is picked once per session; callers hold it by
 * reference and switch on kind() where they need to.
 */
class QTermSink {
    public:
        enum Kind {
            DirectImage,
            CellFallback
        };

        QTermSink( Kind kind, QIODevice *out );
        virtual ~QTermSink();

        Kind kind() const;
        QIODevice *device() const;

        /* Top-left cell (0-based) of the frame on the terminal */
        void setFrameOrigin( QPoint cell );
        QPoint frameOrigin() const;

        /**
         * Show @buffer stretched into @placement.targetCells.
         * @buffer is read only and must not be retained past this call.
         */
        virtual void emitImage( const QImage& buffer, const QTermPlacement& placement ) = 0;

        /* Remove the image we put on screen, if any */
        virtual void clear() = 0;

        /* Write @lines into a frame of @frameCols x @frameRows cells */
        void emitText( const QStringList& lines, int frameCols, int frameRows );

        /* Shaded box with a centered @label, filling the frame */
        void emitPlaceholder( const QString& label, int frameCols, int frameRows );

        /* Lines of the placeholder box; never smaller than 10x5 */
        static QStringList placeholder( int width, int height, QString label );

        /* Cut @line down to @cols terminal cells */
        static QString elide( const QString& line, int cols );

        static QString kindName( Kind kind );

    protected:
        void write( const QByteArray& bytes );
        void flush();

        /* Cursor motion to a frame relative cell */
        QByteArray moveTo( int col, int row ) const;

    private:
        Kind mKind;
        QIODevice *mOut;
        QPoint mOrigin;
};

/**
 * Kitty graphics protocol.
 * Images are sent as RGBA under one stable id; an unchanged buffer at
 * unchanged geometry is only re-placed, not retransmitted.
 */
class QTermKittySink : public QTermSink {
    public:
        QTermKittySink( QIODevice *out, quint32 imageId = 1, bool tmux = false );
        ~QTermKittySink();

        void emitImage( const QImage& buffer, const QTermPlacement& placement );
        void clear();

        quint32 imageId() const;

        /* Number of full image uploads so far */
        int transmissions() const;

        /* Escape sequences uploading @rgba under @id and placing it over @cells */
        static QList<QByteArray> transmitCommands( const QImage& rgba, quint32 id, QSize cells );

        /* Escape sequence placing the already uploaded image @id over @cells */
        static QByteArray placeCommand( quint32 id, QSize cells );

        /* Escape sequence deleting image @id and freeing its data */
        static QByteArray deleteCommand( quint32 id );

        /* Wrap one escape sequence for tmux passthrough */
        static QByteArray wrapTmux( const QByteArray& seq );

    private:
        QByteArray wrapped( const QByteArray& seq ) const;

        quint32 mImageId;
        bool mTmux;

        bool mShown;
        qint64 mLastKey;
        QSize mLastSize;
        QSize mLastCells;

        int mTransmissions;
};

/**
 * Cell fallback: one upper-half block per cell, the foreground colour
 * being the upper sample and the background the lower one.
 */
class QTermBlockSink : public QTermSink {
    public:
        QTermBlockSink( QIODevice *out );
        ~QTermBlockSink();

        void emitImage( const QImage& buffer, const QTermPlacement& placement );
        void clear();

        /* One string per cell row, with truecolor SGR sequences */
        static QStringList halfBlocks( const QImage& buffer, QSize cells );

    private:
        QRect mLastCells;
};
