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

#include <qtermdoc/QTermSink.hpp>

/* Base64 payload bytes per escape sequence */
static const int ChunkSize = 4096;

static QByteArray graphics( const QByteArray& control, const QByteArray& payload ) {
    QByteArray seq( "\x1b_G" );

    seq += control;

    if ( payload.size() ) {
        seq += ';';
        seq += payload;
    }

    seq += "\x1b\\";

    return seq;
}


QTermKittySink::QTermKittySink( QIODevice *out, quint32 imageId, bool tmux ) : QTermSink( DirectImage, out ) {
    mImageId       = qMax<quint32>( 1, imageId );
    mTmux          = tmux;
    mShown         = false;
    mLastKey       = 0;
    mTransmissions = 0;
}


QTermKittySink::~QTermKittySink() {
}


void QTermKittySink::emitImage( const QImage& buffer, const QTermPlacement& placement ) {
    if ( buffer.isNull() or placement.targetCells.isEmpty() ) {
        clear();
        return;
    }

    const QSize cells = placement.targetCells.size();

    QByteArray out = moveTo( placement.targetCells.x(), placement.targetCells.y() );

    /** Same pixels, same geometry: the terminal still has the upload */
    if ( mShown and (buffer.cacheKey() == mLastKey) and (buffer.size() == mLastSize) and (cells == mLastCells) ) {
        out += wrapped( placeCommand( mImageId, cells ) );
        write( out );
        flush();

        return;
    }

    const QImage rgba = buffer.convertToFormat( QImage::Format_RGBA8888 );

    for ( const QByteArray& seq: transmitCommands( rgba, mImageId, cells ) ) {
        out += wrapped( seq );
    }

    write( out );
    flush();

    mShown     = true;
    mLastKey   = buffer.cacheKey();
    mLastSize  = buffer.size();
    mLastCells = cells;
    mTransmissions++;
}


void QTermKittySink::clear() {
    if ( not mShown ) {
        return;
    }

    write( wrapped( deleteCommand( mImageId ) ) );
    flush();

    mShown   = false;
    mLastKey = 0;
}


quint32 QTermKittySink::imageId() const {
    return mImageId;
}


int QTermKittySink::transmissions() const {
    return mTransmissions;
}


QList<QByteArray> QTermKittySink::transmitCommands( const QImage& rgba, quint32 id, QSize cells ) {
    QList<QByteArray> cmds;

    QByteArray raw;

    raw.reserve( rgba.width() * rgba.height() * 4 );

    /** Rows may be padded: copy only the pixels */
    for ( int y = 0; y < rgba.height(); y++ ) {
        raw.append( reinterpret_cast<const char *>(rgba.constScanLine( y ) ), rgba.width() * 4 );
    }

    const QByteArray payload = raw.toBase64();

    for ( int pos = 0; pos < payload.size() or pos == 0; pos += ChunkSize ) {
        const QByteArray chunk = payload.mid( pos, ChunkSize );
        const bool       more  = (pos + ChunkSize < payload.size() );

        QByteArray control;

        if ( pos == 0 ) {
            control = QString( "a=T,f=32,s=%1,v=%2,i=%3,p=1,c=%4,r=%5,C=1,q=2," )
                         .arg( rgba.width() ).arg( rgba.height() ).arg( id )
                         .arg( cells.width() ).arg( cells.height() ).toLatin1();
        }

        control += (more ? "m=1" : "m=0");

        cmds << graphics( control, chunk );
    }

    return cmds;
}


QByteArray QTermKittySink::placeCommand( quint32 id, QSize cells ) {
    const QByteArray control = QString( "a=p,i=%1,p=1,c=%2,r=%3,C=1,q=2" ).arg( id ).arg( cells.width() ).arg( cells.height() ).toLatin1();

    return graphics( control, QByteArray() );
}


QByteArray QTermKittySink::deleteCommand( quint32 id ) {
    return graphics( QString( "a=d,d=I,i=%1,q=2" ).arg( id ).toLatin1(), QByteArray() );
}


QByteArray QTermKittySink::wrapTmux( const QByteArray& seq ) {
    QByteArray inner = seq;

    inner.replace( "\x1b", "\x1b\x1b" );

    return QByteArray( "\x1bPtmux;" ) + inner + QByteArray( "\x1b\\" );
}


QByteArray QTermKittySink::wrapped( const QByteArray& seq ) const {
    return (mTmux ? wrapTmux( seq ) : seq);
}
