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
#include <qtermdoc/QTermTextEngine.hpp>

QTermSink::QTermSink( Kind kind, QIODevice *out ) {
    mKind = kind;
    mOut  = out;
}


QTermSink::~QTermSink() {
}


QTermSink::Kind QTermSink::kind() const {
    return mKind;
}


QIODevice *QTermSink::device() const {
    return mOut;
}


void QTermSink::setFrameOrigin( QPoint cell ) {
    mOrigin = cell;
}


QPoint QTermSink::frameOrigin() const {
    return mOrigin;
}


void QTermSink::emitText( const QStringList& lines, int frameCols, int frameRows ) {
    QByteArray out;

    for ( int row = 0; row < frameRows; row++ ) {
        out += moveTo( 0, row );
        out += "\x1b[0m";

        if ( row < lines.count() ) {
            out += elide( lines.at( row ), frameCols ).toUtf8();
        }

        /** Erase whatever the previous frame left on this row */
        out += "\x1b[K";
    }

    write( out );
    flush();
}


void QTermSink::emitPlaceholder( const QString& label, int frameCols, int frameRows ) {
    const QStringList box = placeholder( frameCols, frameRows, label );

    emitText( box.mid( 0, frameRows ), frameCols, frameRows );
}


QStringList QTermSink::placeholder( int width, int height, QString label ) {
    width  = qMax( 10, width );
    height = qMax( 5, height );

    const int innerW = width - 2;
    const int innerH = height - 2;

    const QString shade( QChar( 0x2591 ) );
    const QString rule = QString( QChar( 0x2500 ) ).repeated( innerW );

    label = label.trimmed();

    if ( label.isEmpty() ) {
        label = "image/chart";
    }

    label = elide( label, innerW );

    QStringList box;

    box << QChar( 0x250C ) + rule + QChar( 0x2510 );

    for ( int y = 0; y < innerH; y++ ) {
        if ( y == innerH / 2 ) {
            const int labelW = QTermTextEngine::displayWidth( label );
            const int left   = (innerW - labelW) / 2;
            const int right  = innerW - labelW - left;

            box << QChar( 0x2502 ) + shade.repeated( left ) + label + shade.repeated( right ) + QChar( 0x2502 );
        }

        else {
            box << QChar( 0x2502 ) + shade.repeated( innerW ) + QChar( 0x2502 );
        }
    }

    box << QChar( 0x2514 ) + rule + QChar( 0x2518 );

    return box;
}


QString QTermSink::elide( const QString& line, int cols ) {
    if ( QTermTextEngine::displayWidth( line ) <= cols ) {
        return line;
    }

    QString out;
    int     width = 0;

    for ( uint cp: line.toUcs4() ) {
        const QString ch = QString::fromUcs4( &cp, 1 );
        const int     w  = QTermTextEngine::displayWidth( ch );

        if ( width + w > cols ) {
            break;
        }

        out   += ch;
        width += w;
    }

    return out;
}


QString QTermSink::kindName( Kind kind ) {
    return (kind == DirectImage ? "kitty" : "blocks");
}


void QTermSink::write( const QByteArray& bytes ) {
    if ( not mOut ) {
        return;
    }

    if ( mOut->write( bytes ) != bytes.size() ) {
        qWarning() << "Short write to the terminal:" << mOut->errorString();
    }
}


void QTermSink::flush() {
    QFileDevice *file = qobject_cast<QFileDevice *>( mOut );

    if ( file ) {
        file->flush();
    }
}


QByteArray QTermSink::moveTo( int col, int row ) const {
    return QByteArray( "\x1b[" ) + QByteArray::number( mOrigin.y() + row + 1 ) + ';' + QByteArray::number( mOrigin.x() + col + 1 ) + 'H';
}
